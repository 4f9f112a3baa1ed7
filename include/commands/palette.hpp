#pragma once

int cmd_palette(int argc, char** argv);
