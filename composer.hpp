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

#include <docmodel.hpp>
#include <docxwriter.hpp>
#include <styleengine.hpp>

#include <optional>
#include <string>
#include <vector>

// Builds one document from top to bottom. Blocks can only be appended,
// never edited or removed. Not thread safe.
class DocumentComposer {
public:
    explicit DocumentComposer(const StyleConfig &config = gost_style_config());

    // Last call wins, there is only one section.
    void configure_geometry(const SectionGeometry &g);
    void set_document_info(const std::string &title, const std::string &author);

    void append(const Block &b);

    void append_heading(int level, const std::string &text);
    void append_paragraph(const std::string &text, bool bold = false, bool indented = true);
    void append_list_item(const std::string &text, std::optional<int> ordinal = std::nullopt);
    void append_page_break();
    void append_table(const std::vector<std::string> &header,
                      const std::vector<std::vector<std::string>> &rows);
    void append_toc_entry(const std::string &title, const std::string &page);
    void append_reference(const std::string &text);
    void append_title_line(const std::string &text,
                           TextAlignment alignment = TextAlignment::Centered,
                           bool bold = false);
    void append_blank_lines(int count);

    // The returned reference is invalidated by the next call for the same region.
    Run &add_marginal_run(PageRegion region, TextAlignment alignment);
    void inject_page_number_field(Run &run);
    void number_pages(PageRegion region, TextAlignment alignment = TextAlignment::Centered);

    std::vector<PackagePart> package_parts() const;

    // Can be called more than once, every call writes the same bytes.
    // No further appends are possible afterwards.
    void serialize(const char *ofilename);

    const Document &document() const { return doc; }
    const StyleConfig &style_config() const { return doc.config; }
    bool is_finalized() const { return finalized; }

private:
    void check_open() const;
    StyledParagraph styled(BlockKind kind, const StyleFlags &flags, const std::string &text) const;

    Document doc;
    int next_reference = 1;
    bool finalized = false;
};
