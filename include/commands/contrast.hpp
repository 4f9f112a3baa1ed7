#pragma once

int cmd_contrast(int argc, char** argv);
