#pragma once

// esg-agent resolve --config <path> --company <name> --year <n>
int cmd_resolve(int argc, char** argv);
