#ifndef CLI_HELP_H
#define CLI_HELP_H

void writeUsage();

#endif
