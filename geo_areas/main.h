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

#ifndef GEO_AREAS_MAIN_H_
#define GEO_AREAS_MAIN_H_

const char USER_AGENT[] = "geo-areas/1.0";

const char AREAS_FILE_ENV[] = "AREAS_FILE";
const char AREAS_URL_ENV[] = "AREAS_URL";
const char DEFAULT_AREAS_FILE[] = "areas/areas.json";

#endif  // GEO_AREAS_MAIN_H_
