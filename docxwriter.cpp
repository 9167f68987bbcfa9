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

#include <docxwriter.hpp>
#include <docerrors.hpp>
#include <zipwriter.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

const char wordml_ns[] = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
const char officerels_ns[] =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
const char packagerels_ns[] = "http://schemas.openxmlformats.org/package/2006/relationships";
const char contenttypes_ns[] = "http://schemas.openxmlformats.org/package/2006/content-types";

const char reltype_document[] =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
const char reltype_core[] =
    "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties";
const char reltype_app[] =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties";
const char reltype_styles[] =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
const char reltype_settings[] =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/settings";
const char reltype_header[] =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/header";
const char reltype_footer[] =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer";

const char ct_main[] =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml";
const char ct_styles[] = "application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml";
const char ct_settings[] =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.settings+xml";
const char ct_header[] = "application/vnd.openxmlformats-officedocument.wordprocessingml.header+xml";
const char ct_footer[] = "application/vnd.openxmlformats-officedocument.wordprocessingml.footer+xml";
const char ct_core[] = "application/vnd.openxmlformats-package.core-properties+xml";
const char ct_app[] = "application/vnd.openxmlformats-officedocument.extended-properties+xml";
const char ct_rels[] = "application/vnd.openxmlformats-package.relationships+xml";

// OOXML line spacing in "auto" mode is expressed in 240ths of a line.
const double single_line = 240;

// Word's own default for left and right cell padding.
const long cell_margin_twips = 108;

std::string to_xml(tinyxml2::XMLDocument &xml) {
    tinyxml2::XMLPrinter printer(nullptr, true);
    xml.Print(&printer);
    return std::string(printer.CStr());
}

void add_declaration(tinyxml2::XMLDocument &xml) {
    xml.InsertFirstChild(
        xml.NewDeclaration(R"(xml version="1.0" encoding="UTF-8" standalone="yes")"));
}

tinyxml2::XMLElement *add_child(tinyxml2::XMLNode *parent, const char *name) {
    auto *el = parent->GetDocument()->NewElement(name);
    parent->InsertEndChild(el);
    return el;
}

void set_number(tinyxml2::XMLElement *el, const char *name, long value) {
    el->SetAttribute(name, std::to_string(value).c_str());
}

tinyxml2::XMLElement *add_valued(tinyxml2::XMLNode *parent, const char *name, const char *value) {
    auto *el = add_child(parent, name);
    el->SetAttribute("w:val", value);
    return el;
}

tinyxml2::XMLElement *wordml_root(tinyxml2::XMLDocument &xml, const char *name) {
    add_declaration(xml);
    auto *root = xml.NewElement(name);
    xml.InsertEndChild(root);
    root->SetAttribute("xmlns:w", wordml_ns);
    root->SetAttribute("xmlns:r", officerels_ns);
    return root;
}

void add_relationship(tinyxml2::XMLElement *rels,
                      const std::string &id,
                      const char *type,
                      const std::string &target) {
    auto *rel = add_child(rels, "Relationship");
    rel->SetAttribute("Id", id.c_str());
    rel->SetAttribute("Type", type);
    rel->SetAttribute("Target", target.c_str());
}

void write_run_properties(tinyxml2::XMLElement *r, const StyleRecord &style) {
    auto *rpr = add_child(r, "w:rPr");
    auto *fonts = add_child(rpr, "w:rFonts");
    fonts->SetAttribute("w:ascii", style.font_family.c_str());
    fonts->SetAttribute("w:hAnsi", style.font_family.c_str());
    fonts->SetAttribute("w:eastAsia", style.east_asia_font.c_str());
    fonts->SetAttribute("w:cs", style.font_family.c_str());
    if(style.bold) {
        add_child(rpr, "w:b");
        add_child(rpr, "w:bCs");
    }
    const auto size = std::to_string(style.font_size.half_points());
    add_valued(rpr, "w:sz", size.c_str());
    add_valued(rpr, "w:szCs", size.c_str());
}

// XML 1.0 forbids most C0 controls and parsers fold carriage returns
// away. Only tab and line feed are kept.
std::string xml_text(const std::string &text) {
    std::string result;
    result.reserve(text.size());
    for(const char c : text) {
        if(static_cast<unsigned char>(c) >= 0x20 || c == '\t' || c == '\n') {
            result += c;
        }
    }
    return result;
}

// Tabs and line feeds are elements of their own in WordprocessingML.
void write_run_text(tinyxml2::XMLElement *r, const std::string &text) {
    std::string buf;
    auto flush = [&]() {
        if(buf.empty()) {
            return;
        }
        auto *t = add_child(r, "w:t");
        t->SetAttribute("xml:space", "preserve");
        t->SetText(buf.c_str());
        buf.clear();
    };
    for(const char c : xml_text(text)) {
        if(c == '\t') {
            flush();
            add_child(r, "w:tab");
        } else if(c == '\n') {
            flush();
            add_child(r, "w:br");
        } else {
            buf += c;
        }
    }
    flush();
}

void write_run(tinyxml2::XMLElement *p, const StyleRecord &style, const std::vector<RunNode> &nodes) {
    auto *r = add_child(p, "w:r");
    write_run_properties(r, style);
    for(const auto &node : nodes) {
        if(auto *text = std::get_if<TextNode>(&node)) {
            write_run_text(r, text->text);
        } else if(std::holds_alternative<FieldBegin>(node)) {
            add_child(r, "w:fldChar")->SetAttribute("w:fldCharType", "begin");
        } else if(auto *instr = std::get_if<FieldInstruction>(&node)) {
            auto *it = add_child(r, "w:instrText");
            it->SetAttribute("xml:space", "preserve");
            it->SetText(instr->instruction.c_str());
        } else if(std::holds_alternative<FieldEnd>(node)) {
            add_child(r, "w:fldChar")->SetAttribute("w:fldCharType", "end");
        } else {
            printf("Unknown run node type.\n");
            std::abort();
        }
    }
}

void write_table_borders(tinyxml2::XMLElement *tblpr) {
    auto *borders = add_child(tblpr, "w:tblBorders");
    for(const char *side : {"w:top", "w:left", "w:bottom", "w:right", "w:insideH", "w:insideV"}) {
        auto *b = add_valued(borders, side, "single");
        b->SetAttribute("w:sz", "4");
        b->SetAttribute("w:space", "0");
        b->SetAttribute("w:color", "auto");
    }
}

const SectionGeometry &require_geometry(const Document &d) {
    if(!d.geometry) {
        throw GeometryNotConfigured("Page geometry must be set before saving.");
    }
    return *d.geometry;
}

} // namespace

DocxWriter::DocxWriter(const Document &d) : doc(d), geom(require_geometry(d)) {}

std::vector<DocxWriter::MarginalPart> DocxWriter::marginal_parts() const {
    std::vector<MarginalPart> parts;
    // rId1 and rId2 are taken by styles and settings.
    int next_id = 3;
    auto add = [&](PageRegion region, const Marginal *content, bool first, int number) {
        const char *stem = region == PageRegion::Header ? "header" : "footer";
        MarginalPart part;
        part.region = region;
        part.first_page = first;
        part.part_name = std::string(stem) + std::to_string(number) + ".xml";
        part.rel_id = "rId" + std::to_string(next_id++);
        part.content = content;
        parts.push_back(std::move(part));
    };
    if(doc.header) {
        add(PageRegion::Header, &*doc.header, false, 1);
        if(geom.different_first_page) {
            add(PageRegion::Header, nullptr, true, 2);
        }
    }
    if(doc.footer) {
        add(PageRegion::Footer, &*doc.footer, false, 1);
        if(geom.different_first_page) {
            add(PageRegion::Footer, nullptr, true, 2);
        }
    }
    return parts;
}

std::vector<PackagePart> DocxWriter::build_parts() const {
    const auto marginals = marginal_parts();
    std::vector<PackagePart> parts;
    parts.push_back(PackagePart{"[Content_Types].xml", content_types_xml(marginals)});
    parts.push_back(PackagePart{"_rels/.rels", package_rels_xml()});
    parts.push_back(PackagePart{"docProps/core.xml", core_xml()});
    parts.push_back(PackagePart{"docProps/app.xml", app_xml()});
    parts.push_back(PackagePart{"word/document.xml", document_xml(marginals)});
    parts.push_back(PackagePart{"word/_rels/document.xml.rels", document_rels_xml(marginals)});
    parts.push_back(PackagePart{"word/styles.xml", styles_xml()});
    parts.push_back(PackagePart{"word/settings.xml", settings_xml()});
    for(const auto &m : marginals) {
        parts.push_back(PackagePart{"word/" + m.part_name, marginal_xml(m)});
    }
    return parts;
}

std::string DocxWriter::build_package() const {
    ZipWriter zip;
    for(const auto &part : build_parts()) {
        zip.add_file(part.name, part.content);
    }
    return zip.finish();
}

void DocxWriter::write(const char *ofilename) const {
    const auto package = build_package();
    FILE *f = fopen(ofilename, "wb");
    if(!f) {
        throw IOFailure(std::string("Could not open ") + ofilename + ": " + strerror(errno));
    }
    const size_t written = fwrite(package.data(), 1, package.size(), f);
    if(written != package.size()) {
        const int err = errno;
        fclose(f);
        throw IOFailure(std::string("Writing ") + ofilename + " failed: " + strerror(err));
    }
    if(fclose(f) != 0) {
        throw IOFailure(std::string("Closing ") + ofilename + " failed: " + strerror(errno));
    }
}

std::string DocxWriter::content_types_xml(const std::vector<MarginalPart> &marginals) const {
    tinyxml2::XMLDocument xml;
    add_declaration(xml);
    auto *types = xml.NewElement("Types");
    xml.InsertEndChild(types);
    types->SetAttribute("xmlns", contenttypes_ns);

    auto *rels = add_child(types, "Default");
    rels->SetAttribute("Extension", "rels");
    rels->SetAttribute("ContentType", ct_rels);
    auto *plain = add_child(types, "Default");
    plain->SetAttribute("Extension", "xml");
    plain->SetAttribute("ContentType", "application/xml");

    auto add_override = [&](const std::string &part, const char *type) {
        auto *o = add_child(types, "Override");
        o->SetAttribute("PartName", part.c_str());
        o->SetAttribute("ContentType", type);
    };
    add_override("/word/document.xml", ct_main);
    add_override("/word/styles.xml", ct_styles);
    add_override("/word/settings.xml", ct_settings);
    for(const auto &m : marginals) {
        add_override("/word/" + m.part_name,
                     m.region == PageRegion::Header ? ct_header : ct_footer);
    }
    add_override("/docProps/core.xml", ct_core);
    add_override("/docProps/app.xml", ct_app);
    return to_xml(xml);
}

std::string DocxWriter::package_rels_xml() const {
    tinyxml2::XMLDocument xml;
    add_declaration(xml);
    auto *rels = xml.NewElement("Relationships");
    xml.InsertEndChild(rels);
    rels->SetAttribute("xmlns", packagerels_ns);
    add_relationship(rels, "rId1", reltype_document, "word/document.xml");
    add_relationship(rels, "rId2", reltype_core, "docProps/core.xml");
    add_relationship(rels, "rId3", reltype_app, "docProps/app.xml");
    return to_xml(xml);
}

// No creation or modification dates, they would make the output
// differ from one run to the next.
std::string DocxWriter::core_xml() const {
    tinyxml2::XMLDocument xml;
    add_declaration(xml);
    auto *props = xml.NewElement("cp:coreProperties");
    xml.InsertEndChild(props);
    props->SetAttribute("xmlns:cp",
                        "http://schemas.openxmlformats.org/package/2006/metadata/core-properties");
    props->SetAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
    props->SetAttribute("xmlns:dcterms", "http://purl.org/dc/terms/");
    props->SetAttribute("xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance");
    add_child(props, "dc:title")->SetText(xml_text(doc.info.title).c_str());
    add_child(props, "dc:creator")->SetText(xml_text(doc.info.author).c_str());
    add_child(props, "dc:language")->SetText(doc.info.language.c_str());
    return to_xml(xml);
}

std::string DocxWriter::app_xml() const {
    tinyxml2::XMLDocument xml;
    add_declaration(xml);
    auto *props = xml.NewElement("Properties");
    xml.InsertEndChild(props);
    props->SetAttribute(
        "xmlns", "http://schemas.openxmlformats.org/officeDocument/2006/extended-properties");
    add_child(props, "Application")->SetText("gostdoc");
    return to_xml(xml);
}

std::string DocxWriter::document_xml(const std::vector<MarginalPart> &marginals) const {
    tinyxml2::XMLDocument xml;
    auto *root = wordml_root(xml, "w:document");
    auto *body = add_child(root, "w:body");
    for(size_t i = 0; i < doc.elements.size(); ++i) {
        const auto &e = doc.elements[i];
        if(auto *par = std::get_if<StyledParagraph>(&e)) {
            write_paragraph(body, *par);
        } else if(auto *table = std::get_if<StyledTable>(&e)) {
            write_table(body, *table);
            // Two adjacent tables would be merged by the viewer, and the
            // body must not end in a table.
            const bool next_is_paragraph =
                i + 1 < doc.elements.size() &&
                !std::holds_alternative<StyledTable>(doc.elements[i + 1]);
            if(!next_is_paragraph) {
                add_child(body, "w:p");
            }
        } else if(std::holds_alternative<PageBreakMark>(e)) {
            write_page_break(body);
        } else {
            printf("Unknown document element type.\n");
            std::abort();
        }
    }
    write_section_properties(body, marginals);
    return to_xml(xml);
}

void DocxWriter::write_paragraph(tinyxml2::XMLElement *parent, const StyledParagraph &par) const {
    const auto &style = par.style;
    auto *p = add_child(parent, "w:p");
    auto *ppr = add_child(p, "w:pPr");
    if(style.toc_tabs) {
        auto *tabs = add_child(ppr, "w:tabs");
        auto *nested = add_valued(tabs, "w:tab", "left");
        set_number(nested, "w:pos", doc.config.first_line_indent.twips());
        auto *page = add_valued(tabs, "w:tab", "right");
        page->SetAttribute("w:leader", "dot");
        set_number(page, "w:pos", geom.text_width().twips());
    }
    auto *spacing = add_child(ppr, "w:spacing");
    set_number(spacing, "w:before", style.space_before.twips());
    set_number(spacing, "w:after", style.space_after.twips());
    set_number(spacing, "w:line", std::lround(style.line_spacing * single_line));
    spacing->SetAttribute("w:lineRule", "auto");
    if(style.first_line_indent) {
        auto *ind = add_child(ppr, "w:ind");
        set_number(ind, "w:firstLine", style.first_line_indent->twips());
    }
    add_valued(ppr, "w:jc", alignment_name(style.alignment));
    write_run(p, style, std::vector<RunNode>{TextNode{par.text}});
}

void DocxWriter::write_table(tinyxml2::XMLElement *body, const StyledTable &table) const {
    const size_t columns = table.num_columns();
    if(columns == 0) {
        return;
    }
    const long table_width = geom.text_width().twips();
    const long column_width = table_width / long(columns);

    auto *tbl = add_child(body, "w:tbl");
    auto *tblpr = add_child(tbl, "w:tblPr");
    auto *tblw = add_child(tblpr, "w:tblW");
    set_number(tblw, "w:w", table_width);
    tblw->SetAttribute("w:type", "dxa");
    write_table_borders(tblpr);
    add_child(tblpr, "w:tblLayout")->SetAttribute("w:type", "fixed");
    auto *cellmar = add_child(tblpr, "w:tblCellMar");
    for(const char *side : {"w:left", "w:right"}) {
        auto *m = add_child(cellmar, side);
        set_number(m, "w:w", cell_margin_twips);
        m->SetAttribute("w:type", "dxa");
    }

    auto *grid = add_child(tbl, "w:tblGrid");
    for(size_t c = 0; c < columns; ++c) {
        set_number(add_child(grid, "w:gridCol"), "w:w", column_width);
    }
    for(const auto &row : table.rows) {
        auto *tr = add_child(tbl, "w:tr");
        for(const auto &cell : row) {
            auto *tc = add_child(tr, "w:tc");
            auto *tcpr = add_child(tc, "w:tcPr");
            auto *tcw = add_child(tcpr, "w:tcW");
            set_number(tcw, "w:w", column_width);
            tcw->SetAttribute("w:type", "dxa");
            write_paragraph(tc, cell);
        }
    }
}

void DocxWriter::write_page_break(tinyxml2::XMLElement *body) const {
    auto *p = add_child(body, "w:p");
    auto *r = add_child(p, "w:r");
    add_child(r, "w:br")->SetAttribute("w:type", "page");
}

void DocxWriter::write_section_properties(tinyxml2::XMLElement *body,
                                          const std::vector<MarginalPart> &marginals) const {
    auto *sectpr = add_child(body, "w:sectPr");
    for(const auto &m : marginals) {
        auto *ref = add_child(
            sectpr, m.region == PageRegion::Header ? "w:headerReference" : "w:footerReference");
        ref->SetAttribute("w:type", m.first_page ? "first" : "default");
        ref->SetAttribute("r:id", m.rel_id.c_str());
    }
    auto *pgsz = add_child(sectpr, "w:pgSz");
    set_number(pgsz, "w:w", geom.page_width.twips());
    set_number(pgsz, "w:h", geom.page_height.twips());
    auto *pgmar = add_child(sectpr, "w:pgMar");
    set_number(pgmar, "w:top", geom.top.twips());
    set_number(pgmar, "w:right", geom.right.twips());
    set_number(pgmar, "w:bottom", geom.bottom.twips());
    set_number(pgmar, "w:left", geom.left.twips());
    set_number(pgmar, "w:header", geom.header_distance.twips());
    set_number(pgmar, "w:footer", geom.footer_distance.twips());
    set_number(pgmar, "w:gutter", 0);
    if(geom.different_first_page) {
        add_child(sectpr, "w:titlePg");
    }
}

std::string DocxWriter::document_rels_xml(const std::vector<MarginalPart> &marginals) const {
    tinyxml2::XMLDocument xml;
    add_declaration(xml);
    auto *rels = xml.NewElement("Relationships");
    xml.InsertEndChild(rels);
    rels->SetAttribute("xmlns", packagerels_ns);
    add_relationship(rels, "rId1", reltype_styles, "styles.xml");
    add_relationship(rels, "rId2", reltype_settings, "settings.xml");
    for(const auto &m : marginals) {
        add_relationship(rels,
                         m.rel_id,
                         m.region == PageRegion::Header ? reltype_header : reltype_footer,
                         m.part_name);
    }
    return to_xml(xml);
}

std::string DocxWriter::styles_xml() const {
    const auto &config = doc.config;
    tinyxml2::XMLDocument xml;
    auto *styles = wordml_root(xml, "w:styles");
    auto *defaults = add_child(styles, "w:docDefaults");
    auto *rpr = add_child(add_child(defaults, "w:rPrDefault"), "w:rPr");
    auto *fonts = add_child(rpr, "w:rFonts");
    for(const char *attr : {"w:ascii", "w:hAnsi", "w:eastAsia", "w:cs"}) {
        fonts->SetAttribute(attr, config.font_family.c_str());
    }
    const auto size = std::to_string(config.font_size.half_points());
    add_valued(rpr, "w:sz", size.c_str());
    add_valued(rpr, "w:szCs", size.c_str());
    auto *lang = add_valued(rpr, "w:lang", doc.info.language.c_str());
    lang->SetAttribute("w:eastAsia", doc.info.language.c_str());
    auto *ppr = add_child(add_child(defaults, "w:pPrDefault"), "w:pPr");
    auto *spacing = add_child(ppr, "w:spacing");
    set_number(spacing, "w:after", 0);
    set_number(spacing, "w:line", std::lround(single_line));
    spacing->SetAttribute("w:lineRule", "auto");

    auto *normal = add_child(styles, "w:style");
    normal->SetAttribute("w:type", "paragraph");
    normal->SetAttribute("w:default", "1");
    normal->SetAttribute("w:styleId", "Normal");
    add_valued(normal, "w:name", "Normal");
    add_child(normal, "w:qFormat");

    auto *table = add_child(styles, "w:style");
    table->SetAttribute("w:type", "table");
    table->SetAttribute("w:default", "1");
    table->SetAttribute("w:styleId", "TableNormal");
    add_valued(table, "w:name", "Normal Table");
    auto *tblpr = add_child(table, "w:tblPr");
    auto *cellmar = add_child(tblpr, "w:tblCellMar");
    for(const char *side : {"w:top", "w:left", "w:bottom", "w:right"}) {
        auto *m = add_child(cellmar, side);
        const bool horizontal = strcmp(side, "w:left") == 0 || strcmp(side, "w:right") == 0;
        set_number(m, "w:w", horizontal ? cell_margin_twips : 0);
        m->SetAttribute("w:type", "dxa");
    }
    return to_xml(xml);
}

std::string DocxWriter::settings_xml() const {
    tinyxml2::XMLDocument xml;
    auto *settings = wordml_root(xml, "w:settings");
    set_number(add_child(settings, "w:defaultTabStop"),
               "w:val",
               doc.config.first_line_indent.twips());
    add_valued(settings, "w:characterSpacingControl", "doNotCompress");
    auto *compat = add_child(add_child(settings, "w:compat"), "w:compatSetting");
    compat->SetAttribute("w:name", "compatibilityMode");
    compat->SetAttribute("w:uri", "http://schemas.microsoft.com/office/word");
    compat->SetAttribute("w:val", "15");
    return to_xml(xml);
}

std::string DocxWriter::marginal_xml(const MarginalPart &part) const {
    tinyxml2::XMLDocument xml;
    auto *root = wordml_root(xml, part.region == PageRegion::Header ? "w:hdr" : "w:ftr");
    auto *p = add_child(root, "w:p");
    if(part.content) {
        auto *ppr = add_child(p, "w:pPr");
        add_valued(ppr, "w:jc", alignment_name(part.content->alignment));
        for(const auto &run : part.content->runs) {
            write_run(p, run.style, run.nodes);
        }
    }
    return to_xml(xml);
}
