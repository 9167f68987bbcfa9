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

#include <stdexcept>
#include <string>

class DocError : public std::runtime_error {
public:
    explicit DocError(const std::string &msg) : std::runtime_error(msg) {}
};

// Output file could not be created or written.
class IOFailure : public DocError {
public:
    explicit IOFailure(const std::string &msg) : DocError(msg) {}
};

// A table data row does not have as many cells as the header row.
class MalformedTableShape : public DocError {
public:
    explicit MalformedTableShape(const std::string &msg) : DocError(msg) {}
};

class DocumentFinalized : public DocError {
public:
    explicit DocumentFinalized(const std::string &msg) : DocError(msg) {}
};

class GeometryNotConfigured : public DocError {
public:
    explicit GeometryNotConfigured(const std::string &msg) : DocError(msg) {}
};

// Bad or missing entry in a report definition file.
class ConfigError : public DocError {
public:
    explicit ConfigError(const std::string &msg) : DocError(msg) {}
};
