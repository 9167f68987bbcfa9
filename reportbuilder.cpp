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
#include <exception>

namespace {

std::string signature_line(const std::string &label, int tabs, const std::string &name) {
    std::string line = label;
    line.append(tabs > 0 ? size_t(tabs) : 1, '\t');
    line += name;
    return line;
}

} // namespace

void compose_title_page(DocumentComposer &c, const ReportMetadata &m) {
    for(const auto &line : m.organization) {
        c.append_title_line(line);
    }
    c.append_blank_lines(5);
    c.append_title_line(m.work_type);
    c.append_title_line(m.topic_label);
    c.append_title_line(m.topic_title, TextAlignment::Centered, true);
    c.append_blank_lines(1);
    if(!m.course.empty()) {
        c.append_title_line(m.course);
        c.append_blank_lines(1);
    }
    for(const auto &line : m.program) {
        c.append_title_line(line);
    }
    c.append_blank_lines(4);
    c.append_title_line(signature_line(m.student_label,
                                       m.student_tabs,
                                       m.student_name + ", " + m.group),
                        TextAlignment::Left);
    c.append_blank_lines(1);
    c.append_title_line(signature_line(m.teacher_label, m.teacher_tabs, m.teacher_name),
                        TextAlignment::Left);
    c.append_blank_lines(8);
    c.append_title_line(m.city + " " + m.year);
}

void compose_table_of_contents(DocumentComposer &c,
                               const std::string &title,
                               const std::vector<TocEntry> &entries) {
    c.append_heading(1, title);
    for(const auto &e : entries) {
        c.append_toc_entry(e.title, e.page);
    }
}

void compose_references(DocumentComposer &c,
                        const std::string &title,
                        const std::vector<std::string> &references) {
    c.append_heading(1, title);
    for(const auto &r : references) {
        c.append_reference(r);
    }
}

void compose_report(DocumentComposer &c, const ReportDefinition &def) {
    c.configure_geometry(def.geometry);
    c.set_document_info(def.meta.topic_title, def.meta.student_name);
    if(def.page_numbers) {
        c.number_pages(PageRegion::Footer);
    }
    compose_title_page(c, def.meta);
    c.append_page_break();
    if(!def.toc.empty()) {
        compose_table_of_contents(c, def.toc_title, def.toc);
        c.append_page_break();
    }
    for(const auto &b : def.content) {
        c.append(b);
    }
    if(!def.references.empty()) {
        c.append_page_break();
        compose_references(c, def.references_title, def.references);
    }
}

int generate_report(const char *definition, const char *ofilename) {
    try {
        const auto def = load_report_json(definition);
        const std::filesystem::path ofile =
            ofilename ? std::filesystem::path(ofilename) : def.top_dir / def.output;
        DocumentComposer composer(def.style);
        compose_report(composer, def);
        printf("Composed %d elements.\n", (int)composer.document().elements.size());
        composer.serialize(ofile.c_str());
        printf("Document saved: %s\n", ofile.c_str());
    } catch(const DocError &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    } catch(const std::exception &e) {
        fprintf(stderr, "Unexpected failure: %s\n", e.what());
        return 1;
    }
    return 0;
}
