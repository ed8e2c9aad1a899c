// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef GEO_AREAS_ERRORS_HPP_
#define GEO_AREAS_ERRORS_HPP_

#include <stdexcept>  // for runtime_error
#include <string>     // for string

using std::string;
using std::runtime_error;

namespace errors {

// Base for every error raised by the area engine
struct AreaError : runtime_error {
    using runtime_error::runtime_error;
};

// Malformed ring or coordinate data at build time
struct InvalidGeometry : AreaError {
    using AreaError::AreaError;
};

// Operation referenced an unknown slug
struct NotFound : AreaError {
    using AreaError::AreaError;
};

// Rename target slug already exists
struct Conflict : AreaError {
    using AreaError::AreaError;
};

// Request is missing required input or carries out of range values
struct InvalidRequest : AreaError {
    using AreaError::AreaError;
};

// Durable storage unreachable or corrupt while loading
struct HydrationFailure : AreaError {
    using AreaError::AreaError;
};

// Durable storage unwritable while saving
struct PersistenceFailure : AreaError {
    using AreaError::AreaError;
};

}  // namespace errors

#endif  // GEO_AREAS_ERRORS_HPP_
