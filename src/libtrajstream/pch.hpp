#ifndef __PCH_HPP__
#define __PCH_HPP__

#include <typeinfo>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector> 
#include <array>
#include <memory>
#include <functional>
#include <optional>
#include <variant>
#include <future>
#include <mutex>
#include <atomic>
#include <chrono>
#include <regex>
#include <map>
#include <set>
#include <unordered_map>
#include <algorithm>
#include <iterator>
#include <limits>
#include <charconv>
#include <cmath>

#include <cerrno>
#include <cstring>
#include <cstdint>
#include <cstdlib>
#include <cstdio>

#include <Eigen/Dense>

#endif 
