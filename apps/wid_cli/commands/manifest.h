#pragma once

// manifest pack | inspect | verify | unpack
int cmd_manifest(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
