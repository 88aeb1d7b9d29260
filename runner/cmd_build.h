#pragma once

// stagehand_cli build -i <project> -o <output> -c <config.json> [-d]
int cmd_build(int argc, char** argv);
