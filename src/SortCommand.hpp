#ifndef SORT_COMMAND_HPP
#define SORT_COMMAND_HPP

#include <ostream>
#include <string>
#include <vector>

// Command-line front end: parse args (without the program name), check the source,
// create the destination, sort once and report. Returns the process exit status.
int runSorter(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

#endif
