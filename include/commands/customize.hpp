#pragma once

int cmd_customize(int argc, char** argv);
