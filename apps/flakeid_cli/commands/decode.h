#pragma once

// cmd_decode: print the timestamp, node id and sequence packed in each id.
// Usage: flakeid_cli decode <id> [<id>...]
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
