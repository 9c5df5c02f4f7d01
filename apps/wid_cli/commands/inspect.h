#pragma once

int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_parse(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
