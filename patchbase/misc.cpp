#include <cstdlib>

#include "misc.hpp"

using namespace std;

bool check_env(const char *name) {
    const char *val = getenv(name);
    return val != nullptr && val == "true"sv;
}
