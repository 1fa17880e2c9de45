#include "plangrid/core/task.hpp"

#include <algorithm>
#include <cctype>

namespace plangrid::core {

bool signals_milestone(const Task& task) {
  if (task.is_milestone) {
    return true;
  }
  std::string upper = task.name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return upper.find("MILESTONE") != std::string::npos;
}

}  // namespace plangrid::core
