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
#include <fieldinjector.hpp>

#include <cstdio>
#include <cstdlib>

DocumentComposer::DocumentComposer(const StyleConfig &config) { doc.config = config; }

void DocumentComposer::check_open() const {
    if(finalized) {
        throw DocumentFinalized("Document has already been serialized.");
    }
}

StyledParagraph DocumentComposer::styled(BlockKind kind,
                                         const StyleFlags &flags,
                                         const std::string &text) const {
    StyledParagraph par;
    par.style = style_for(kind, flags, doc.config);
    par.text = render_text(par.style, text);
    return par;
}

void DocumentComposer::configure_geometry(const SectionGeometry &g) {
    check_open();
    doc.geometry = g;
}

void DocumentComposer::set_document_info(const std::string &title, const std::string &author) {
    check_open();
    doc.info.title = title;
    doc.info.author = author;
}

void DocumentComposer::append(const Block &b) {
    if(auto *h = std::get_if<Heading>(&b)) {
        append_heading(h->level, h->text);
    } else if(auto *p = std::get_if<Paragraph>(&b)) {
        append_paragraph(p->text, p->bold, p->indented);
    } else if(auto *li = std::get_if<ListItem>(&b)) {
        append_list_item(li->text, li->ordinal);
    } else if(std::holds_alternative<PageBreak>(b)) {
        append_page_break();
    } else if(auto *t = std::get_if<Table>(&b)) {
        append_table(t->header, t->rows);
    } else if(auto *toc = std::get_if<TocEntry>(&b)) {
        append_toc_entry(toc->title, toc->page);
    } else if(auto *ref = std::get_if<ReferenceEntry>(&b)) {
        append_reference(ref->text);
    } else if(auto *tl = std::get_if<TitleLine>(&b)) {
        append_title_line(tl->text, tl->alignment, tl->bold);
    } else {
        printf("Unknown block type.\n");
        std::abort();
    }
}

void DocumentComposer::append_heading(int level, const std::string &text) {
    check_open();
    BlockKind kind;
    if(level == 1) {
        kind = BlockKind::Heading1;
    } else if(level == 2) {
        kind = BlockKind::Heading2;
    } else {
        throw DocError("Unsupported heading level " + std::to_string(level) + ".");
    }
    doc.elements.emplace_back(styled(kind, StyleFlags{}, text));
}

void DocumentComposer::append_paragraph(const std::string &text, bool bold, bool indented) {
    check_open();
    StyleFlags flags;
    flags.bold = bold;
    flags.indented = indented;
    doc.elements.emplace_back(styled(BlockKind::Body, flags, text));
}

void DocumentComposer::append_list_item(const std::string &text, std::optional<int> ordinal) {
    check_open();
    StyleFlags flags;
    flags.ordinal = ordinal;
    doc.elements.emplace_back(styled(BlockKind::ListItem, flags, text));
}

void DocumentComposer::append_page_break() {
    check_open();
    doc.elements.emplace_back(PageBreakMark{});
}

void DocumentComposer::append_table(const std::vector<std::string> &header,
                                    const std::vector<std::vector<std::string>> &rows) {
    check_open();
    if(header.empty()) {
        throw MalformedTableShape("Table header row has no cells.");
    }
    for(size_t i = 0; i < rows.size(); ++i) {
        if(rows[i].size() != header.size()) {
            throw MalformedTableShape("Table row " + std::to_string(i + 1) + " has " +
                                      std::to_string(rows[i].size()) + " cells, header has " +
                                      std::to_string(header.size()) + ".");
        }
    }
    StyleFlags header_flags;
    header_flags.bold = true;
    StyleFlags data_flags;

    StyledTable table;
    table.rows.reserve(rows.size() + 1);
    auto &header_row = table.rows.emplace_back();
    for(const auto &cell : header) {
        header_row.push_back(styled(BlockKind::TableCell, header_flags, cell));
    }
    for(const auto &row : rows) {
        auto &data_row = table.rows.emplace_back();
        for(const auto &cell : row) {
            data_row.push_back(styled(BlockKind::TableCell, data_flags, cell));
        }
    }
    doc.elements.emplace_back(std::move(table));
}

void DocumentComposer::append_toc_entry(const std::string &title, const std::string &page) {
    check_open();
    std::string text;
    if(has_subsection_prefix(title)) {
        text += '\t';
    }
    text += title;
    text += '\t';
    text += page;
    doc.elements.emplace_back(styled(BlockKind::TocEntry, StyleFlags{}, text));
}

void DocumentComposer::append_reference(const std::string &text) {
    check_open();
    StyleFlags flags;
    flags.ordinal = next_reference++;
    doc.elements.emplace_back(styled(BlockKind::Reference, flags, text));
}

void DocumentComposer::append_title_line(const std::string &text,
                                         TextAlignment alignment,
                                         bool bold) {
    check_open();
    StyleFlags flags;
    flags.alignment = alignment;
    flags.bold = bold;
    doc.elements.emplace_back(styled(BlockKind::TitleLine, flags, text));
}

void DocumentComposer::append_blank_lines(int count) {
    for(int i = 0; i < count; ++i) {
        append_title_line("", TextAlignment::Left);
    }
}

Run &DocumentComposer::add_marginal_run(PageRegion region, TextAlignment alignment) {
    check_open();
    auto &marginal = region == PageRegion::Header ? doc.header : doc.footer;
    if(!marginal) {
        marginal = Marginal{};
    }
    marginal->alignment = alignment;
    StyleFlags flags;
    flags.alignment = alignment;
    Run run;
    run.style = style_for(BlockKind::TitleLine, flags, doc.config);
    marginal->runs.push_back(std::move(run));
    return marginal->runs.back();
}

void DocumentComposer::inject_page_number_field(Run &run) {
    check_open();
    ::inject_page_number_field(run);
}

void DocumentComposer::number_pages(PageRegion region, TextAlignment alignment) {
    inject_page_number_field(add_marginal_run(region, alignment));
}

std::vector<PackagePart> DocumentComposer::package_parts() const {
    return DocxWriter(doc).build_parts();
}

void DocumentComposer::serialize(const char *ofilename) {
    DocxWriter writer(doc);
    finalized = true;
    writer.write(ofilename);
}
