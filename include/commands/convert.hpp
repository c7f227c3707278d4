#pragma once

int cmd_convert(int argc, char** argv);
