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

#include <zipwriter.hpp>
#include <docerrors.hpp>

namespace {

// Noon on 1980-01-01 UTC. miniz converts through local time and noon keeps
// the DOS date inside 1980 in every time zone.
const MZ_TIME_T entry_mtime = 315576000;

} // namespace

ZipWriter::ZipWriter() {
    mz_zip_zero_struct(&zip);
    if(!mz_zip_writer_init_heap(&zip, 0, 0)) {
        fail("Could not initialize zip archive");
    }
}

ZipWriter::~ZipWriter() { mz_zip_writer_end(&zip); }

void ZipWriter::fail(const char *what) {
    throw DocError(std::string(what) + ": " +
                   mz_zip_get_error_string(mz_zip_get_last_error(&zip)) + ".");
}

void ZipWriter::add_file(const std::string &name, const std::string &data) {
    if(finished) {
        throw DocError("Can not add files to a finished archive.");
    }
    MZ_TIME_T mtime = entry_mtime;
    if(!mz_zip_writer_add_mem_ex_v2(&zip,
                                    name.c_str(),
                                    data.data(),
                                    data.size(),
                                    nullptr,
                                    0,
                                    MZ_BEST_COMPRESSION,
                                    0,
                                    0,
                                    &mtime,
                                    nullptr,
                                    0,
                                    nullptr,
                                    0)) {
        fail(("Could not add " + name + " to zip archive").c_str());
    }
}

std::string ZipWriter::finish() {
    if(finished) {
        return archive;
    }
    void *buf = nullptr;
    size_t size = 0;
    if(!mz_zip_writer_finalize_heap_archive(&zip, &buf, &size)) {
        fail("Could not finalize zip archive");
    }
    archive.assign(static_cast<const char *>(buf), size);
    mz_free(buf);
    finished = true;
    return archive;
}
