#pragma once

int cmd_menu(int argc, char** argv);
