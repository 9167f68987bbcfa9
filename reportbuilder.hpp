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

#include <composer.hpp>
#include <reportdef.hpp>

void compose_title_page(DocumentComposer &c, const ReportMetadata &m);

void compose_table_of_contents(DocumentComposer &c,
                               const std::string &title,
                               const std::vector<TocEntry> &entries);

void compose_references(DocumentComposer &c,
                        const std::string &title,
                        const std::vector<std::string> &references);

// Issues every composer call for the report in reading order.
void compose_report(DocumentComposer &c, const ReportDefinition &def);

// Loads a definition, composes it and writes the document. A null output
// name means the one given in the definition. Failures are reported on
// stderr and give a nonzero return value.
int generate_report(const char *definition, const char *ofilename);
