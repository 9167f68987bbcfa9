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

#include <composer.hpp>
#include <docerrors.hpp>

#include <tinyxml2.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace fs = std::filesystem;

namespace {

const std::string &find_part(const std::vector<PackagePart> &parts, const char *name) {
    for(const auto &p : parts) {
        if(p.name == name) {
            return p.content;
        }
    }
    printf("Part %s missing.\n", name);
    std::abort();
}

bool has_part(const std::vector<PackagePart> &parts, const char *name) {
    for(const auto &p : parts) {
        if(p.name == name) {
            return true;
        }
    }
    return false;
}

void parse_part(tinyxml2::XMLDocument &xml,
                const std::vector<PackagePart> &parts,
                const char *name) {
    const auto &content = find_part(parts, name);
    if(xml.Parse(content.c_str(), content.size()) != tinyxml2::XML_SUCCESS) {
        printf("Part %s is not well formed.\n", name);
        std::abort();
    }
}

tinyxml2::XMLElement *body_of(tinyxml2::XMLDocument &xml) {
    return xml.FirstChildElement("w:document")->FirstChildElement("w:body");
}

bool attr_is(const tinyxml2::XMLElement *el, const char *name, const char *value) {
    if(!el) {
        return false;
    }
    const char *a = el->Attribute(name);
    return a && strcmp(a, value) == 0;
}

const tinyxml2::XMLElement *ppr_child(const tinyxml2::XMLElement *p, const char *name) {
    return p->FirstChildElement("w:pPr")->FirstChildElement(name);
}

bool run_is_bold(const tinyxml2::XMLElement *p) {
    return p->FirstChildElement("w:r")->FirstChildElement("w:rPr")->FirstChildElement("w:b") !=
           nullptr;
}

std::string run_text(const tinyxml2::XMLElement *p) {
    std::string text;
    const auto *r = p->FirstChildElement("w:r");
    for(auto *c = r->FirstChildElement(); c; c = c->NextSiblingElement()) {
        if(strcmp(c->Name(), "w:t") == 0 && c->GetText()) {
            text += c->GetText();
        } else if(strcmp(c->Name(), "w:tab") == 0) {
            text += '\t';
        }
    }
    return text;
}

int count_children(const tinyxml2::XMLElement *parent, const char *name) {
    int n = 0;
    for(auto *c = parent->FirstChildElement(name); c; c = c->NextSiblingElement(name)) {
        ++n;
    }
    return n;
}

std::string read_file(const fs::path &p) {
    std::ifstream f(p, std::ios::binary);
    CHECK(!f.fail());
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

DocumentComposer gost_composer() {
    DocumentComposer c;
    c.configure_geometry(gost_geometry());
    return c;
}

} // namespace

void test_heading_and_paragraph() {
    auto c = gost_composer();
    c.append_heading(1, "введение");
    c.append_paragraph("text", false, true);
    const auto parts = c.package_parts();
    tinyxml2::XMLDocument xml;
    parse_part(xml, parts, "word/document.xml");
    auto *body = body_of(xml);

    auto *heading = body->FirstChildElement("w:p");
    CHECK(attr_is(ppr_child(heading, "w:jc"), "w:val", "center"));
    CHECK(run_is_bold(heading));
    CHECK(run_text(heading) == "ВВЕДЕНИЕ");
    auto *rpr = heading->FirstChildElement("w:r")->FirstChildElement("w:rPr");
    CHECK(attr_is(rpr->FirstChildElement("w:sz"), "w:val", "28"));
    CHECK(attr_is(rpr->FirstChildElement("w:rFonts"), "w:eastAsia", "Times New Roman"));
    CHECK(attr_is(ppr_child(heading, "w:spacing"), "w:after", "240"));
    CHECK(attr_is(ppr_child(heading, "w:spacing"), "w:line", "360"));

    auto *par = heading->NextSiblingElement("w:p");
    CHECK(attr_is(ppr_child(par, "w:jc"), "w:val", "both"));
    CHECK(attr_is(ppr_child(par, "w:ind"), "w:firstLine", "709"));
    CHECK(!run_is_bold(par));
    CHECK(run_text(par) == "text");
}

void test_table_shape() {
    auto c = gost_composer();
    c.append_table({"A", "B"}, {{"1", "2"}, {"3", "4"}});
    const auto parts = c.package_parts();
    tinyxml2::XMLDocument xml;
    parse_part(xml, parts, "word/document.xml");
    auto *tbl = body_of(xml)->FirstChildElement("w:tbl");
    CHECK(tbl);
    CHECK(count_children(tbl, "w:tr") == 3);
    CHECK(count_children(tbl->FirstChildElement("w:tblGrid"), "w:gridCol") == 2);

    std::vector<std::vector<const tinyxml2::XMLElement *>> cells;
    for(auto *tr = tbl->FirstChildElement("w:tr"); tr; tr = tr->NextSiblingElement("w:tr")) {
        CHECK(count_children(tr, "w:tc") == 2);
        auto &row = cells.emplace_back();
        for(auto *tc = tr->FirstChildElement("w:tc"); tc; tc = tc->NextSiblingElement("w:tc")) {
            row.push_back(tc->FirstChildElement("w:p"));
        }
    }
    CHECK(run_text(cells[0][0]) == "A");
    CHECK(run_is_bold(cells[0][0]));
    CHECK(run_is_bold(cells[0][1]));
    CHECK(run_text(cells[2][1]) == "4");
    CHECK(!run_is_bold(cells[2][1]));
    CHECK(!run_is_bold(cells[1][0]));

    // The body may not end in a table.
    CHECK(tbl->NextSiblingElement("w:p"));
}

void test_table_mismatch() {
    auto c = gost_composer();
    bool thrown = false;
    try {
        c.append_table({"a", "b", "c", "d"}, {{"1", "2", "3"}});
    } catch(const MalformedTableShape &) {
        thrown = true;
    }
    CHECK(thrown);
    CHECK(c.document().elements.empty());

    thrown = false;
    try {
        c.append_table({}, {});
    } catch(const MalformedTableShape &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_repeatable_serialize() {
    auto c = gost_composer();
    c.number_pages(PageRegion::Footer);
    c.append_heading(1, "Введение");
    c.append_paragraph("Первый абзац.");
    c.append_list_item("пункт", 1);
    c.append_table({"A", "B"}, {{"1", "2"}});
    c.append_page_break();
    c.append_reference("Источник");

    const auto dir = fs::temp_directory_path();
    const auto first = dir / "gostdoc_composertest_1.docx";
    const auto second = dir / "gostdoc_composertest_2.docx";
    c.serialize(first.c_str());
    c.serialize(second.c_str());
    const auto a = read_file(first);
    const auto b = read_file(second);
    CHECK(!a.empty());
    CHECK(a == b);
    CHECK(a.compare(0, 4, "PK\x03\x04") == 0);
    fs::remove(first);
    fs::remove(second);
}

void test_unwritable_path() {
    auto c = gost_composer();
    c.append_paragraph("x");
    bool thrown = false;
    try {
        c.serialize("/nonexistent-gostdoc-directory/out.docx");
    } catch(const IOFailure &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_finalized() {
    auto c = gost_composer();
    const auto out = fs::temp_directory_path() / "gostdoc_composertest_final.docx";
    c.serialize(out.c_str());
    CHECK(c.is_finalized());
    bool thrown = false;
    try {
        c.append_paragraph("late");
    } catch(const DocumentFinalized &) {
        thrown = true;
    }
    CHECK(thrown);
    fs::remove(out);
}

void test_missing_geometry() {
    DocumentComposer c;
    c.append_paragraph("x");
    bool thrown = false;
    try {
        c.package_parts();
    } catch(const GeometryNotConfigured &) {
        thrown = true;
    }
    CHECK(thrown);
    CHECK(!c.is_finalized());
}

void test_geometry() {
    DocumentComposer c;
    auto letter = gost_geometry();
    letter.page_width = Length::from_mm(100);
    letter.different_first_page = false;
    c.configure_geometry(letter);
    c.configure_geometry(gost_geometry());
    const auto parts = c.package_parts();
    tinyxml2::XMLDocument xml;
    parse_part(xml, parts, "word/document.xml");
    auto *sectpr = body_of(xml)->FirstChildElement("w:sectPr");
    CHECK(sectpr);
    CHECK(attr_is(sectpr->FirstChildElement("w:pgSz"), "w:w", "11906"));
    CHECK(attr_is(sectpr->FirstChildElement("w:pgSz"), "w:h", "16838"));
    auto *pgmar = sectpr->FirstChildElement("w:pgMar");
    CHECK(attr_is(pgmar, "w:left", "1701"));
    CHECK(attr_is(pgmar, "w:right", "850"));
    CHECK(attr_is(pgmar, "w:top", "1134"));
    CHECK(attr_is(pgmar, "w:bottom", "1134"));
    CHECK(attr_is(pgmar, "w:header", "709"));
    CHECK(attr_is(pgmar, "w:footer", "709"));
    CHECK(sectpr->FirstChildElement("w:titlePg"));
}

void test_page_number_footer() {
    auto c = gost_composer();
    c.number_pages(PageRegion::Footer);
    c.append_paragraph("body");
    const auto parts = c.package_parts();
    CHECK(has_part(parts, "word/footer1.xml"));
    CHECK(has_part(parts, "word/footer2.xml"));
    CHECK(!has_part(parts, "word/header1.xml"));

    tinyxml2::XMLDocument footer;
    parse_part(footer, parts, "word/footer1.xml");
    auto *p = footer.FirstChildElement("w:ftr")->FirstChildElement("w:p");
    CHECK(attr_is(ppr_child(p, "w:jc"), "w:val", "center"));
    CHECK(count_children(p, "w:r") == 1);
    auto *r = p->FirstChildElement("w:r");
    auto *begin = r->FirstChildElement("w:rPr")->NextSiblingElement();
    CHECK(begin && strcmp(begin->Name(), "w:fldChar") == 0);
    CHECK(attr_is(begin, "w:fldCharType", "begin"));
    auto *instr = begin->NextSiblingElement();
    CHECK(instr && strcmp(instr->Name(), "w:instrText") == 0);
    CHECK(strcmp(instr->GetText(), "PAGE") == 0);
    auto *end = instr->NextSiblingElement();
    CHECK(end && strcmp(end->Name(), "w:fldChar") == 0);
    CHECK(attr_is(end, "w:fldCharType", "end"));
    CHECK(!end->NextSiblingElement());

    // The first page footer is empty.
    tinyxml2::XMLDocument first;
    parse_part(first, parts, "word/footer2.xml");
    CHECK(!first.FirstChildElement("w:ftr")->FirstChildElement("w:p")->FirstChildElement("w:r"));

    tinyxml2::XMLDocument xml;
    parse_part(xml, parts, "word/document.xml");
    auto *sectpr = body_of(xml)->FirstChildElement("w:sectPr");
    CHECK(count_children(sectpr, "w:footerReference") == 2);
    // Field nodes never leak into body paragraphs.
    auto *bp = body_of(xml)->FirstChildElement("w:p");
    CHECK(!bp->FirstChildElement("w:r")->FirstChildElement("w:fldChar"));
}

void test_header_injection() {
    auto c = gost_composer();
    auto &run = c.add_marginal_run(PageRegion::Header, TextAlignment::Left);
    run.nodes.push_back(TextNode{"Стр. "});
    c.inject_page_number_field(run);
    const auto parts = c.package_parts();
    tinyxml2::XMLDocument header;
    parse_part(header, parts, "word/header1.xml");
    auto *p = header.FirstChildElement("w:hdr")->FirstChildElement("w:p");
    CHECK(attr_is(ppr_child(p, "w:jc"), "w:val", "left"));
    auto *t = p->FirstChildElement("w:r")->FirstChildElement("w:t");
    CHECK(strcmp(t->GetText(), "Стр. ") == 0);
    CHECK(attr_is(t->NextSiblingElement(), "w:fldCharType", "begin"));
}

void test_list_and_toc() {
    auto c = gost_composer();
    c.append_list_item("third", 3);
    c.append_list_item("bullet");
    c.append_toc_entry("1 АНАЛИЗ", "5");
    c.append_toc_entry("1.1 Описание", "5");
    c.append_reference("First");
    c.append_reference("Second");
    const auto parts = c.package_parts();
    tinyxml2::XMLDocument xml;
    parse_part(xml, parts, "word/document.xml");
    auto *p = body_of(xml)->FirstChildElement("w:p");
    CHECK(run_text(p) == "3) third");
    p = p->NextSiblingElement("w:p");
    CHECK(run_text(p) == "– bullet");
    p = p->NextSiblingElement("w:p");
    CHECK(run_text(p) == "1 АНАЛИЗ\t5");
    CHECK(attr_is(ppr_child(p, "w:ind"), "w:firstLine", "0"));
    auto *tabs = ppr_child(p, "w:tabs");
    CHECK(count_children(tabs, "w:tab") == 2);
    CHECK(attr_is(tabs->LastChildElement("w:tab"), "w:leader", "dot"));
    CHECK(attr_is(tabs->LastChildElement("w:tab"), "w:pos", "9354"));
    p = p->NextSiblingElement("w:p");
    CHECK(run_text(p) == "\t1.1 Описание\t5");
    p = p->NextSiblingElement("w:p");
    CHECK(run_text(p) == "1. First");
    p = p->NextSiblingElement("w:p");
    CHECK(run_text(p) == "2. Second");
}

void test_empty_and_break() {
    auto c = gost_composer();
    c.append_paragraph("");
    c.append_page_break();
    c.append_blank_lines(2);
    CHECK(c.document().elements.size() == 4);
    const auto parts = c.package_parts();
    tinyxml2::XMLDocument xml;
    parse_part(xml, parts, "word/document.xml");
    auto *p = body_of(xml)->FirstChildElement("w:p");
    CHECK(run_text(p).empty());
    CHECK(attr_is(ppr_child(p, "w:jc"), "w:val", "both"));
    p = p->NextSiblingElement("w:p");
    CHECK(attr_is(p->FirstChildElement("w:r")->FirstChildElement("w:br"), "w:type", "page"));
}

void test_block_dispatch() {
    auto c = gost_composer();
    const std::vector<Block> blocks{Heading{2, "1.1 Раздел"},
                                    Paragraph{"bold", true, false},
                                    ListItem{"li", 7},
                                    PageBreak{},
                                    Table{{"h"}, {{"d"}}},
                                    TocEntry{"T", "1"},
                                    ReferenceEntry{"R"},
                                    TitleLine{"Москва 2025", TextAlignment::Centered, false}};
    for(const auto &b : blocks) {
        c.append(b);
    }
    const auto &elements = c.document().elements;
    CHECK(elements.size() == blocks.size());
    CHECK(std::get<StyledParagraph>(elements[0]).style.bold);
    CHECK(std::get<StyledParagraph>(elements[0]).text == "1.1 Раздел");
    CHECK(std::get<StyledParagraph>(elements[1]).style.first_line_indent->twips() == 0);
    CHECK(std::get<StyledParagraph>(elements[2]).text == "7) li");
    CHECK(std::holds_alternative<PageBreakMark>(elements[3]));
    CHECK(std::get<StyledTable>(elements[4]).rows.size() == 2);
    CHECK(std::get<StyledParagraph>(elements[6]).text == "1. R");

    bool thrown = false;
    try {
        c.append(Heading{3, "deep"});
    } catch(const DocError &) {
        thrown = true;
    }
    CHECK(thrown);

    thrown = false;
    try {
        c.append_heading(1, "\xff\xfe");
    } catch(const DocError &) {
        thrown = true;
    }
    CHECK(thrown);
    CHECK(elements.size() == blocks.size());
}

void test_control_characters() {
    auto c = gost_composer();
    c.set_document_info("x\x02"
                        "y",
                        "Автор");
    c.append_paragraph("a\x01"
                       "b\f"
                       "c\r"
                       "d\te");
    const auto parts = c.package_parts();
    tinyxml2::XMLDocument xml;
    parse_part(xml, parts, "word/document.xml");
    CHECK(run_text(body_of(xml)->FirstChildElement("w:p")) == "abcd\te");
    tinyxml2::XMLDocument core;
    parse_part(core, parts, "docProps/core.xml");
    auto *props = core.FirstChildElement("cp:coreProperties");
    CHECK(strcmp(props->FirstChildElement("dc:title")->GetText(), "xy") == 0);
}

void test_package_parts() {
    auto c = gost_composer();
    c.set_document_info("Тема", "Автор");
    const auto parts = c.package_parts();
    CHECK(parts.front().name == "[Content_Types].xml");
    for(const char *name : {"_rels/.rels",
                            "docProps/core.xml",
                            "docProps/app.xml",
                            "word/document.xml",
                            "word/_rels/document.xml.rels",
                            "word/styles.xml",
                            "word/settings.xml"}) {
        CHECK(has_part(parts, name));
    }
    tinyxml2::XMLDocument core;
    parse_part(core, parts, "docProps/core.xml");
    auto *props = core.FirstChildElement("cp:coreProperties");
    CHECK(strcmp(props->FirstChildElement("dc:title")->GetText(), "Тема") == 0);
    CHECK(strcmp(props->FirstChildElement("dc:creator")->GetText(), "Автор") == 0);

    tinyxml2::XMLDocument styles;
    parse_part(styles, parts, "word/styles.xml");
    auto *fonts = styles.FirstChildElement("w:styles")
                      ->FirstChildElement("w:docDefaults")
                      ->FirstChildElement("w:rPrDefault")
                      ->FirstChildElement("w:rPr")
                      ->FirstChildElement("w:rFonts");
    CHECK(attr_is(fonts, "w:ascii", "Times New Roman"));
}

int main(int, char **) {
    printf("Running composer tests.\n");
    test_heading_and_paragraph();
    test_table_shape();
    test_table_mismatch();
    test_repeatable_serialize();
    test_unwritable_path();
    test_finalized();
    test_missing_geometry();
    test_geometry();
    test_page_number_footer();
    test_header_injection();
    test_list_and_toc();
    test_empty_and_break();
    test_block_dispatch();
    test_package_parts();
    test_control_characters();
    return 0;
}
