#pragma once

// cmd_generate: print freshly generated ids.
// Usage: flakeid_cli generate [--node-id <0..1023|auto>] [--count <n>] [--format dec|hex|json]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
