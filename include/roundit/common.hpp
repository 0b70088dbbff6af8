#ifndef ROUNDIT_COMMON_HPP_
#define ROUNDIT_COMMON_HPP_

#include <glog/logging.h>

#include <climits>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>  // pair
#include <vector>

// Disable the copy and assignment operator for a class.
#define DISABLE_COPY_AND_ASSIGN(classname) \
 private:\
  classname(const classname&);\
  classname& operator=(const classname&)

// Instantiate a class with float and double specifications.
#define INSTANTIATE_CLASS(classname) \
  char gInstantiationGuard##classname; \
  template class classname<float>; \
  template class classname<double>

namespace roundit {

// Common functions and classes from std that roundit often uses.
using std::fabs;
using std::ostringstream;
using std::pair;
using std::string;
using std::vector;

typedef unsigned int seed_type;

}  // namespace roundit

#endif  // ROUNDIT_COMMON_HPP_
