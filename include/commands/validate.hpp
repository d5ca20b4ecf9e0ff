#pragma once

// esg-agent validate [--outdir <dir>] [--out <path>]
int cmd_validate(int argc, char** argv);
