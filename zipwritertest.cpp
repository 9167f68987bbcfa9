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
#include <composer.hpp>
#include <docerrors.hpp>

#include <cstdio>
#include <cstdlib>
#include <vector>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

struct ZipEntry {
    std::string name;
    std::string data;
    mz_uint32 crc;
    MZ_TIME_T mtime;
};

std::vector<ZipEntry> read_archive(const std::string &archive) {
    std::vector<ZipEntry> entries;
    mz_zip_archive reader;
    mz_zip_zero_struct(&reader);
    CHECK(mz_zip_reader_init_mem(&reader, archive.data(), archive.size(), 0));
    const mz_uint count = mz_zip_reader_get_num_files(&reader);
    for(mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat stat;
        CHECK(mz_zip_reader_file_stat(&reader, i, &stat));
        ZipEntry e;
        e.name = stat.m_filename;
        e.crc = stat.m_crc32;
        e.mtime = stat.m_time;
        size_t size = 0;
        void *buf = mz_zip_reader_extract_to_heap(&reader, i, &size, 0);
        CHECK(buf || stat.m_uncomp_size == 0);
        CHECK(size == stat.m_uncomp_size);
        if(buf) {
            e.data.assign(static_cast<const char *>(buf), size);
            mz_free(buf);
        }
        entries.push_back(std::move(e));
    }
    mz_zip_reader_end(&reader);
    return entries;
}

} // namespace

void test_roundtrip_contents() {
    ZipWriter zip;
    const std::string xml{"<?xml version=\"1.0\"?><a>Привет</a>"};
    zip.add_file("first.xml", xml);
    zip.add_file("dir/empty.txt", "");
    const auto archive = zip.finish();
    const auto entries = read_archive(archive);
    CHECK(entries.size() == 2);
    CHECK(entries[0].name == "first.xml");
    CHECK(entries[0].data == xml);
    CHECK(entries[0].crc == mz_crc32(MZ_CRC32_INIT,
                                     reinterpret_cast<const unsigned char *>(xml.data()),
                                     xml.size()));
    CHECK(entries[0].mtime == entries[1].mtime);
    CHECK(entries[1].name == "dir/empty.txt");
    CHECK(entries[1].data.empty());
    CHECK(entries[1].crc == 0);
}

void test_reproducible() {
    auto build = []() {
        ZipWriter zip;
        zip.add_file("a.xml", std::string(5000, 'x'));
        zip.add_file("b.xml", "b");
        return zip.finish();
    };
    CHECK(build() == build());
}

void test_finished_archive() {
    ZipWriter zip;
    zip.add_file("a", "a");
    const auto first = zip.finish();
    CHECK(first == zip.finish());
    bool thrown = false;
    try {
        zip.add_file("b", "b");
    } catch(const DocError &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_docx_package() {
    DocumentComposer c;
    c.configure_geometry(gost_geometry());
    c.number_pages(PageRegion::Footer);
    c.append_heading(1, "Заключение");
    const auto parts = c.package_parts();
    const auto entries = read_archive(DocxWriter(c.document()).build_package());
    CHECK(entries.size() == parts.size());
    CHECK(entries.front().name == "[Content_Types].xml");
    for(size_t i = 0; i < parts.size(); ++i) {
        CHECK(entries[i].name == parts[i].name);
        CHECK(entries[i].data == parts[i].content);
    }
}

int main(int, char **) {
    printf("Running zip writer tests.\n");
    test_roundtrip_contents();
    test_reproducible();
    test_finished_archive();
    test_docx_package();
    return 0;
}
