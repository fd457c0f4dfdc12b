#include "otp_uri_store.h"
#include <nlohmann/json.hpp>
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

static void write_file(const std::string& path, const std::string& body) {
    std::ofstream out(path, std::ios::trunc);
    out << body;
}

int main() {
    const std::string path = "otp_uri_store_test.json";
    std::remove(path.c_str());

    // missing file = empty store
    JsonFileUriStore store(path);
    assert(store.list_uri_strings().empty());
    assert(!store.remove_uri_string("otpauth://totp/none?secret=AAAA"));

    // duplicates in the file are dropped, first occurrence order kept
    write_file(path, R"({"uris": ["u1", "u2", "u1", "u3"]})");
    auto uris = store.list_uri_strings();
    assert(uris.size() == 3);
    assert(uris[0] == "u1" && uris[1] == "u2" && uris[2] == "u3");

    // remove is idempotent and persisted
    assert(store.remove_uri_string("u2"));
    assert(!store.remove_uri_string("u2"));
    {
        JsonFileUriStore reopened(path);
        auto after = reopened.list_uri_strings();
        assert(after.size() == 2);
        assert(after[0] == "u1" && after[1] == "u3");
    }
    {
        std::ifstream in(path);
        nlohmann::json j;
        in >> j;
        assert(j.at("uris").size() == 2);
    }

    // add appends once
    assert(store.add_uri_string("u4"));
    assert(!store.add_uri_string("u4"));
    assert(store.list_uri_strings().back() == "u4");

    // malformed content is an error, not an empty store
    write_file(path, "{not json");
    bool threw = false;
    try { store.list_uri_strings(); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    write_file(path, R"({"uris": [1, 2]})");
    threw = false;
    try { store.list_uri_strings(); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    std::remove(path.c_str());

    // something at the path that cannot be read is an error; add must not replace it
    const std::string dir = "otp_uri_store_test.d";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directory(dir);
    JsonFileUriStore blocked(dir);
    threw = false;
    try { blocked.list_uri_strings(); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);
    threw = false;
    try { blocked.add_uri_string("u5"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);
    assert(std::filesystem::is_directory(dir));
    std::filesystem::remove_all(dir);

    std::cout << "JsonFileUriStore test passed.\n";
    return 0;
}
