#pragma once

// esg-agent run --config <path> [--outdir <dir>] [--workers <n>]
int cmd_run(int argc, char** argv);
