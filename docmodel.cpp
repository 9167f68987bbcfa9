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

#include <docmodel.hpp>

SectionGeometry gost_geometry() {
    SectionGeometry g;
    g.page_width = Length::from_mm(210);
    g.page_height = Length::from_mm(297);
    g.left = Length::from_mm(30);
    g.right = Length::from_mm(15);
    g.top = Length::from_mm(20);
    g.bottom = Length::from_mm(20);
    g.header_distance = Length::from_mm(12.5);
    g.footer_distance = Length::from_mm(12.5);
    // The title page is counted but carries no number.
    g.different_first_page = true;
    return g;
}
