#pragma once

int cmd_salaries(int argc, char** argv);
