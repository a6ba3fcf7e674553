#pragma once

int cmd_analyze(int argc, char** argv);
