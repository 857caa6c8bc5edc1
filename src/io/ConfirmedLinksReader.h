/**
Copyright 2025 CatalogLinker Team
Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at
    http://www.apache.org/licenses/LICENSE-2.0
Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
 */


#ifndef CATALOGLINKER_CONFIRMEDLINKSREADER_H
#define CATALOGLINKER_CONFIRMEDLINKSREADER_H

#include <string>

#include "../classifier/TrainingSetBuilder.h"

class ConfirmedLinksReader {
 public:
    /**
     * Reads source_id,target_id lines. A header line, blank lines and # comments are skipped.
     * Malformed lines and repeated sources are logged and ignored; the first link of a source
     * wins. Returns 0 on success, -1 when the file cannot be read.
     */
    static int read(const std::string &path, ConfirmedLinks &links);
};

#endif  // CATALOGLINKER_CONFIRMEDLINKSREADER_H
