// Copyright 2022 Eric Fichter
#ifndef HEADERS_H
#define HEADERS_H

// Standard
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <list>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// TBB
#include <tbb/parallel_for_each.h>
#include <tbb/task_arena.h>
#include <tbb/version.h>

// Boost
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/version.hpp>

// ARCH2ENV
#include "definitions.h"

#endif //HEADERS_H
