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

#include <styleengine.hpp>
#include <fieldinjector.hpp>
#include <docerrors.hpp>

#include <array>
#include <cstdio>
#include <cstdlib>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

const std::array<BlockKind, 8> all_kinds{BlockKind::Heading1,
                                         BlockKind::Heading2,
                                         BlockKind::Body,
                                         BlockKind::ListItem,
                                         BlockKind::TocEntry,
                                         BlockKind::Reference,
                                         BlockKind::TitleLine,
                                         BlockKind::TableCell};

StyleFlags make_flags(bool bold, bool indented, std::optional<int> ordinal) {
    StyleFlags f;
    f.bold = bold;
    f.indented = indented;
    f.ordinal = ordinal;
    return f;
}

} // namespace

void test_deterministic() {
    const auto config = gost_style_config();
    for(const auto kind : all_kinds) {
        for(const bool bold : {false, true}) {
            for(const bool indented : {false, true}) {
                for(const auto ordinal : {std::optional<int>{}, std::optional<int>{4}}) {
                    const auto flags = make_flags(bold, indented, ordinal);
                    const auto first = style_for(kind, flags, config);
                    const auto second = style_for(kind, flags, config);
                    CHECK(first == second);
                    CHECK(render_text(first, "abc") == render_text(second, "abc"));
                }
            }
        }
    }
}

void test_heading1() {
    const auto s = style_for(BlockKind::Heading1, StyleFlags{}, gost_style_config());
    CHECK(s.alignment == TextAlignment::Centered);
    CHECK(s.bold);
    CHECK(s.uppercase);
    CHECK(s.font_size.half_points() == 28);
    CHECK(s.line_spacing == 1.5);
    CHECK(s.space_before.twips() == 0);
    CHECK(s.space_after.twips() == 240);
    CHECK(s.first_line_indent);
    CHECK(s.first_line_indent->twips() == 0);
    CHECK(render_text(s, "abc") == "ABC");
    CHECK(render_text(s, "введение") == "ВВЕДЕНИЕ");
    CHECK(render_text(s, "1 Анализ предметной области") == "1 АНАЛИЗ ПРЕДМЕТНОЙ ОБЛАСТИ");
}

void test_heading2() {
    const auto s = style_for(BlockKind::Heading2, StyleFlags{}, gost_style_config());
    CHECK(s.alignment == TextAlignment::Justified);
    CHECK(s.bold);
    CHECK(!s.uppercase);
    CHECK(s.space_before.twips() == 240);
    CHECK(s.space_after.twips() == 120);
    CHECK(s.first_line_indent->twips() == 709);
    CHECK(render_text(s, "1.1 Описание") == "1.1 Описание");
}

void test_body() {
    const auto config = gost_style_config();
    const auto indented = style_for(BlockKind::Body, make_flags(false, true, {}), config);
    CHECK(indented.alignment == TextAlignment::Justified);
    CHECK(!indented.bold);
    CHECK(indented.first_line_indent->twips() == 709);
    CHECK(indented.line_spacing == 1.5);

    const auto flat = style_for(BlockKind::Body, make_flags(true, false, {}), config);
    CHECK(flat.bold);
    CHECK(flat.first_line_indent->twips() == 0);
}

void test_list_prefix() {
    const auto config = gost_style_config();
    const auto numbered = style_for(BlockKind::ListItem, make_flags(false, true, 3), config);
    CHECK(render_text(numbered, "item") == "3) item");
    CHECK(numbered.first_line_indent->twips() == 709);
    const auto bullet = style_for(BlockKind::ListItem, StyleFlags{}, config);
    CHECK(render_text(bullet, "item") == "– item");
    CHECK(render_text(bullet, "") == "– ");
}

void test_toc_and_reference() {
    const auto config = gost_style_config();
    const auto toc = style_for(BlockKind::TocEntry, StyleFlags{}, config);
    CHECK(toc.alignment == TextAlignment::Justified);
    CHECK(toc.first_line_indent->twips() == 0);
    CHECK(toc.toc_tabs);
    const auto ref = style_for(BlockKind::Reference, make_flags(false, true, 2), config);
    CHECK(ref.first_line_indent->twips() == 0);
    CHECK(render_text(ref, "Book") == "2. Book");
}

void test_title_and_cell() {
    const auto config = gost_style_config();
    StyleFlags flags;
    flags.alignment = TextAlignment::Centered;
    flags.bold = true;
    const auto title = style_for(BlockKind::TitleLine, flags, config);
    CHECK(title.alignment == TextAlignment::Centered);
    CHECK(title.bold);
    CHECK(!title.first_line_indent);
    CHECK(title.line_spacing == 1.0);

    const auto header_cell = style_for(BlockKind::TableCell, flags, config);
    CHECK(header_cell.bold);
    CHECK(header_cell.alignment == TextAlignment::Left);
    CHECK(!style_for(BlockKind::TableCell, StyleFlags{}, config).bold);
}

void test_east_asia_font() {
    const auto config = gost_style_config();
    for(const auto kind : all_kinds) {
        const auto s = style_for(kind, StyleFlags{}, config);
        CHECK(s.font_family == "Times New Roman");
        CHECK(s.east_asia_font == s.font_family);
    }
}

void test_alternate_config() {
    auto config = gost_style_config();
    config.font_family = "Liberation Serif";
    config.font_size = Length::from_pt(12);
    config.first_line_indent = Length::from_cm(1);
    config.list_bullet = "•";
    const auto s = style_for(BlockKind::ListItem, StyleFlags{}, config);
    CHECK(s.font_family == "Liberation Serif");
    CHECK(s.east_asia_font == "Liberation Serif");
    CHECK(s.font_size.half_points() == 24);
    CHECK(s.first_line_indent->twips() == 567);
    CHECK(render_text(s, "x") == "• x");
}

void test_subsection_prefix() {
    CHECK(has_subsection_prefix("1.1 Описание бизнес-процесса"));
    CHECK(has_subsection_prefix("12.3 Something"));
    CHECK(!has_subsection_prefix("1 АНАЛИЗ ПРЕДМЕТНОЙ ОБЛАСТИ"));
    CHECK(!has_subsection_prefix("ВВЕДЕНИЕ"));
    CHECK(!has_subsection_prefix(".1 odd"));
    CHECK(!has_subsection_prefix(""));
}

void test_field_triplet() {
    for(int i = 0; i < 3; ++i) {
        const auto field = build_page_number_field();
        CHECK(field.size() == 3);
        CHECK(std::holds_alternative<FieldBegin>(field[0]));
        CHECK(std::holds_alternative<FieldInstruction>(field[1]));
        CHECK(std::get<FieldInstruction>(field[1]).instruction == "PAGE");
        CHECK(std::holds_alternative<FieldEnd>(field[2]));
    }
}

void test_field_injection() {
    Run run;
    run.nodes.push_back(TextNode{"Page "});
    inject_page_number_field(run);
    inject_page_number_field(run);
    CHECK(run.nodes.size() == 7);
    CHECK(std::holds_alternative<TextNode>(run.nodes[0]));
    CHECK(is_page_number_field(run.nodes, 1));
    CHECK(is_page_number_field(run.nodes, 4));
    CHECK(!is_page_number_field(run.nodes, 0));
    CHECK(!is_page_number_field(run.nodes, 5));
}

void test_uppercase() {
    CHECK(utf8_uppercase("введение") == "ВВЕДЕНИЕ");
    CHECK(utf8_uppercase("").empty());
    for(const char *bad : {"\xff", "ab\xc3", "\xd0\x92\x80"}) {
        bool thrown = false;
        try {
            utf8_uppercase(bad);
        } catch(const DocError &) {
            thrown = true;
        }
        CHECK(thrown);
    }
    const StyleRecord h1 = style_for(BlockKind::Heading1, StyleFlags{}, gost_style_config());
    CHECK(render_text(h1, "Заключение") == "ЗАКЛЮЧЕНИЕ");
}

void test_units() {
    CHECK(Length::from_mm(210).twips() == 11906);
    CHECK(Length::from_mm(297).twips() == 16838);
    CHECK(Length::from_cm(3).twips() == 1701);
    CHECK(Length::from_cm(1.5).twips() == 850);
    CHECK(Length::from_cm(2).twips() == 1134);
    CHECK(Length::from_pt(12).twips() == 240);
    CHECK(Length::from_pt(14).half_points() == 28);
}

int main(int, char **) {
    printf("Running style engine tests.\n");
    test_deterministic();
    test_heading1();
    test_heading2();
    test_body();
    test_list_prefix();
    test_toc_and_reference();
    test_title_and_cell();
    test_east_asia_font();
    test_alternate_config();
    test_subsection_prefix();
    test_field_triplet();
    test_field_injection();
    test_units();
    test_uppercase();
    return 0;
}
