#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include <algorithm>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
