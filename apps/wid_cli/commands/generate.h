#pragma once

int cmd_next(int argc, char* argv[]);         // NOLINT(modernize-avoid-c-arrays)
int cmd_stream(int argc, char* argv[]);       // NOLINT(modernize-avoid-c-arrays)
int cmd_healthcheck(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_bench(int argc, char* argv[]);        // NOLINT(modernize-avoid-c-arrays)
