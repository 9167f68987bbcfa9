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

#include <reportbuilder.hpp>
#include <docerrors.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace fs = std::filesystem;

namespace {

const char full_report[] = R"({
  "output": "report.docx",
  "metadata": {
    "student_name": "Иванов И.И.",
    "group": "221-361",
    "teacher_name": "Петров П.П.",
    "topic_title": "Тестовая тема",
    "year": "2025",
    "organization": ["Министерство", "Университет"],
    "course": "по курсу Проектирование",
    "program": ["по направлению 09.03.03"]
  },
  "geometry": {"left": 25, "unnumbered_title_page": false},
  "style": {"font": "PT Serif", "size": 13},
  "toc": [["ВВЕДЕНИЕ", "3"], ["1.1 Подраздел", "4"]],
  "content": [
    {"type": "heading", "level": 1, "text": "Введение"},
    {"type": "paragraph", "text": "Абзац."},
    {"type": "paragraph", "text": "Без отступа", "indent": false, "bold": true},
    {"type": "item", "text": "первый", "number": 1},
    {"type": "item", "text": "маркер"},
    {"type": "pagebreak"},
    {"type": "heading", "level": 2, "text": "1.1 Подраздел"},
    {"type": "table", "header": ["A", "B"], "rows": [["1", "2"]]},
    {"type": "title", "text": "Подпись", "align": "left"}
  ],
  "references": ["Книга", "Статья"]
})";

fs::path write_definition(const char *name, const char *text) {
    const auto p = fs::temp_directory_path() / name;
    std::ofstream f(p);
    CHECK(!f.fail());
    f << text;
    return p;
}

bool load_fails(const char *text) {
    const auto p = write_definition("gostdoc_reportdeftest_bad.json", text);
    bool thrown = false;
    try {
        load_report_json(p.c_str());
    } catch(const ConfigError &) {
        thrown = true;
    }
    fs::remove(p);
    return thrown;
}

} // namespace

void test_load_full() {
    const auto p = write_definition("gostdoc_reportdeftest.json", full_report);
    const auto def = load_report_json(p.c_str());
    fs::remove(p);
    CHECK(def.output == "report.docx");
    CHECK(def.top_dir == p.parent_path());
    CHECK(def.meta.student_name == "Иванов И.И.");
    CHECK(def.meta.city == "Москва");
    CHECK(def.meta.organization.size() == 2);
    CHECK(def.geometry.left.twips() == Length::from_mm(25).twips());
    CHECK(def.geometry.right.twips() == Length::from_mm(15).twips());
    CHECK(!def.geometry.different_first_page);
    CHECK(def.style.font_family == "PT Serif");
    CHECK(def.style.font_size.half_points() == 26);
    CHECK(def.toc.size() == 2);
    CHECK(def.toc[1].page == "4");
    CHECK(def.content.size() == 9);
    CHECK(std::get<Heading>(def.content[0]).level == 1);
    CHECK(!std::get<Paragraph>(def.content[2]).indented);
    CHECK(std::get<Paragraph>(def.content[2]).bold);
    CHECK(std::get<ListItem>(def.content[3]).ordinal == 1);
    CHECK(!std::get<ListItem>(def.content[4]).ordinal);
    CHECK(std::holds_alternative<PageBreak>(def.content[5]));
    CHECK(std::get<Table>(def.content[7]).rows.size() == 1);
    CHECK(std::get<TitleLine>(def.content[8]).alignment == TextAlignment::Left);
    CHECK(def.references.size() == 2);
    CHECK(def.toc_title == "СОДЕРЖАНИЕ");
}

void test_compose_report() {
    const auto p = write_definition("gostdoc_reportdeftest.json", full_report);
    const auto def = load_report_json(p.c_str());
    fs::remove(p);
    DocumentComposer c(def.style);
    compose_report(c, def);
    const auto &doc = c.document();
    CHECK(doc.geometry);
    CHECK(doc.footer);
    CHECK(!doc.header);
    CHECK(doc.info.title == "Тестовая тема");

    const auto &first = std::get<StyledParagraph>(doc.elements.front());
    CHECK(first.text == "Министерство");
    CHECK(first.style.font_family == "PT Serif");
    CHECK(first.style.alignment == TextAlignment::Centered);

    bool found_student = false;
    bool found_toc_heading = false;
    size_t page_breaks = 0;
    for(const auto &e : doc.elements) {
        if(std::holds_alternative<PageBreakMark>(e)) {
            ++page_breaks;
        } else if(auto *par = std::get_if<StyledParagraph>(&e)) {
            if(par->text.starts_with("Студент:\t") && par->text.ends_with("Иванов И.И., 221-361")) {
                found_student = true;
            }
            if(par->text == "СОДЕРЖАНИЕ") {
                found_toc_heading = true;
            }
        }
    }
    CHECK(found_student);
    CHECK(found_toc_heading);
    // Title page, table of contents, the one in the content and the bibliography.
    CHECK(page_breaks == 4);

    const auto &last = std::get<StyledParagraph>(doc.elements.back());
    CHECK(last.text == "2. Статья");
    CHECK(!c.package_parts().empty());
}

void test_bad_definitions() {
    CHECK(load_fails("not json"));
    CHECK(load_fails("[]"));
    CHECK(load_fails(R"({"output": "x.docx", "content": []})"));
    CHECK(load_fails(R"({"output": 3, "metadata": {}, "content": []})"));
    CHECK(load_fails(R"({"output": "x.docx",
                        "metadata": {"student_name": "a", "group": "b", "teacher_name": "c",
                                     "topic_title": "d", "year": "e"},
                        "content": [{"type": "video"}]})"));
    CHECK(load_fails(R"({"output": "x.docx",
                        "metadata": {"student_name": "a", "group": "b", "teacher_name": "c",
                                     "topic_title": "d", "year": "e"},
                        "content": [{"type": "title", "text": "t", "align": "diagonal"}]})"));
    CHECK(load_fails("{\"output\": \"x.docx\","
                     " \"metadata\": {\"student_name\": \"\xff\xfe\", \"group\": \"b\","
                     " \"teacher_name\": \"c\", \"topic_title\": \"d\", \"year\": \"e\"},"
                     " \"content\": []}"));
    bool thrown = false;
    try {
        load_report_json("/nonexistent-gostdoc-directory/report.json");
    } catch(const ConfigError &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_generate_report() {
    const auto p = write_definition("gostdoc_reportdeftest.json", full_report);
    const auto out = fs::temp_directory_path() / "gostdoc_reportdeftest.docx";
    fs::remove(out);
    CHECK(generate_report(p.c_str(), out.c_str()) == 0);
    CHECK(fs::file_size(out) > 0);
    CHECK(generate_report(p.c_str(), "/nonexistent-gostdoc-directory/report.docx") == 1);
    CHECK(generate_report("/nonexistent-gostdoc-directory/report.json", nullptr) == 1);
    fs::remove(out);
    fs::remove(p);
}

int main(int, char **) {
    printf("Running report definition tests.\n");
    test_load_full();
    test_compose_report();
    test_bad_definitions();
    test_generate_report();
    return 0;
}
