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

#include <cstdio>

int main(int argc, char **argv) {
    if(argc != 2 && argc != 3) {
        printf("%s <report.json> [output.docx]\n", argv[0]);
        return 1;
    }
    return generate_report(argv[1], argc == 3 ? argv[2] : nullptr);
}
