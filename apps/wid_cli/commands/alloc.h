#pragma once

int cmd_alloc(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
