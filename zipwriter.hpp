/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <miniz.h>

#include <string>

// Builds a ZIP archive in memory. Entries are deflated and stamped with
// a fixed date, so identical input gives identical bytes.
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter &) = delete;
    ZipWriter &operator=(const ZipWriter &) = delete;

    void add_file(const std::string &name, const std::string &data);

    // Writes the central directory. Later calls return the same bytes.
    std::string finish();

private:
    [[noreturn]] void fail(const char *what);

    mz_zip_archive zip;
    std::string archive;
    bool finished = false;
};
