/*
 * Regauth
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <fstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "libregauth/Error.hpp"
#include "libregauth/utility/environment.hpp"
#include "libregauth/utility/json.hpp"
#include "libregauth/utility/string.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace libregauth {
namespace test {

namespace {

boost::filesystem::path writeTemporaryFile(const std::string& content) {
    auto path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("regauth-test-%%%%-%%%%.json");
    std::ofstream file{path.string()};
    file << content;
    return path;
}

}

TEST_GROUP(UtilityTestGroup) {
};

TEST(UtilityTestGroup, parseKeyValuePair) {
    auto pair = libregauth::string::parseKeyValuePair("key=value");
    CHECK_EQUAL(pair.first, std::string{"key"});
    CHECK_EQUAL(pair.second, std::string{"value"});

    // key only
    pair = libregauth::string::parseKeyValuePair("key_only");
    CHECK_EQUAL(pair.first, std::string{"key_only"});
    CHECK(pair.second.empty());

    // value containing the separator
    pair = libregauth::string::parseKeyValuePair("key=value=more");
    CHECK_EQUAL(pair.second, std::string{"value=more"});

    // custom separator
    pair = libregauth::string::parseKeyValuePair("user:secret", ':');
    CHECK_EQUAL(pair.first, std::string{"user"});
    CHECK_EQUAL(pair.second, std::string{"secret"});

    // empty key
    CHECK_THROWS(libregauth::Error, libregauth::string::parseKeyValuePair("=value"));
}

TEST(UtilityTestGroup, splitList) {
    auto expected = std::vector<std::string>{"test.domain.com", "index.docker.io"};
    CHECK(libregauth::string::splitList("test.domain.com,index.docker.io") == expected);
    CHECK(libregauth::string::splitList(" test.domain.com , ,index.docker.io,") == expected);
    CHECK(libregauth::string::splitList("a;b", ';') == (std::vector<std::string>{"a", "b"}));
    CHECK(libregauth::string::splitList("").empty());
}

TEST(UtilityTestGroup, parseVariables) {
    char var0[] = "https_proxy=http://proxy.example.com:3128";
    char var1[] = "EMPTY=";
    char* env[] = {var0, var1, nullptr};

    auto variables = libregauth::environment::parseVariables(env);
    CHECK_EQUAL(variables.size(), 2);
    CHECK_EQUAL(variables["https_proxy"], std::string{"http://proxy.example.com:3128"});
    CHECK(variables["EMPTY"].empty());

    CHECK_THROWS(libregauth::Error, libregauth::environment::parseVariable("=no_key"));
}

TEST(UtilityTestGroup, parseJson) {
    auto json = libregauth::json::parse(R"({"token": "abc", "expires_in": 300})");
    CHECK(json.IsObject());
    CHECK_EQUAL(std::string{json["token"].GetString()}, std::string{"abc"});
    CHECK_EQUAL(json["expires_in"].GetUint(), 300u);

    CHECK_THROWS(libregauth::Error, libregauth::json::parse("{not json"));
    CHECK_THROWS(libregauth::Error, libregauth::json::parse(""));
    CHECK_THROWS(libregauth::Error, libregauth::json::parse(std::string{"{\"key\": \"\x80\x80xyz\"}"}));

    auto utf8 = libregauth::json::parse(u8"{\"key\": \"caf\u00e9\"}");
    CHECK_EQUAL(std::string{utf8["key"].GetString()}, std::string{u8"caf\u00e9"});
}

TEST(UtilityTestGroup, readAndValidate) {
    auto schemaFile = writeTemporaryFile(R"({
        "$schema": "http://json-schema.org/draft-04/schema#",
        "type": "object",
        "properties": {
            "registry": {"type": "string"},
            "insecureRegistry": {"type": "boolean"}
        },
        "required": ["registry"],
        "additionalProperties": false
    })");
    auto validFile = writeTemporaryFile(R"({"registry": "registry.example.com", "insecureRegistry": true})");
    auto missingRequiredFile = writeTemporaryFile(R"({"insecureRegistry": true})");
    auto wrongTypeFile = writeTemporaryFile(R"({"registry": 42})");

    auto json = libregauth::json::readAndValidate(validFile, schemaFile);
    CHECK_EQUAL(std::string{json["registry"].GetString()}, std::string{"registry.example.com"});
    CHECK(json["insecureRegistry"].GetBool());

    CHECK_THROWS(libregauth::Error, libregauth::json::readAndValidate(missingRequiredFile, schemaFile));
    CHECK_THROWS(libregauth::Error, libregauth::json::readAndValidate(wrongTypeFile, schemaFile));
    CHECK_THROWS(libregauth::Error, libregauth::json::readAndValidate("/nonexistent/file.json", schemaFile));
    CHECK_THROWS(libregauth::Error, libregauth::json::read("/nonexistent/file.json"));

    for(const auto& file : {schemaFile, validFile, missingRequiredFile, wrongTypeFile}) {
        boost::filesystem::remove(file);
    }
}

}}

REGAUTH_UNITTEST_MAIN_FUNCTION();
