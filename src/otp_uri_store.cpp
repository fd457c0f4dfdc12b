#include "otp_uri_store.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>          // for std::unique_lock
#include <stdexcept>
#include <system_error>
#include <unordered_set>

using json = nlohmann::json;

JsonFileUriStore::JsonFileUriStore(std::string path) : path_(std::move(path)) {}

std::vector<std::string> JsonFileUriStore::read_locked() const {
    std::error_code ec;
    const auto st = std::filesystem::status(path_, ec);
    if (st.type() == std::filesystem::file_type::not_found) return {};   // nothing stored yet
    if (!std::filesystem::is_regular_file(st)) {
        throw std::runtime_error("URI store " + path_ + " is not a readable file");
    }

    std::ifstream in(path_);
    if (!in) throw std::runtime_error("URI store: cannot open " + path_);

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("URI store " + path_ + " is not valid json: " + e.what());
    }
    if (!j.is_object() || !j.contains("uris") || !j.at("uris").is_array()) {
        throw std::runtime_error("URI store " + path_ + " has no \"uris\" array");
    }

    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& v : j.at("uris")) {
        if (!v.is_string()) {
            throw std::runtime_error("URI store " + path_ + " holds a non-string entry");
        }
        auto s = v.get<std::string>();
        if (seen.insert(s).second) out.push_back(std::move(s)); // first occurrence wins
    }
    return out;
}

void JsonFileUriStore::write_locked(const std::vector<std::string>& uris) const {
    json j;
    j["uris"] = uris;

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("URI store: cannot write " + tmp);
        out << j.dump(2) << '\n';
        if (!out.flush()) throw std::runtime_error("URI store: write failed for " + tmp);
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw std::runtime_error("URI store: cannot replace " + path_);
    }
}

std::vector<std::string> JsonFileUriStore::list_uri_strings() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return read_locked();
}

bool JsonFileUriStore::remove_uri_string(const std::string& uri) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto uris = read_locked();
    auto it = std::find(uris.begin(), uris.end(), uri);
    if (it == uris.end()) return false;
    uris.erase(it);
    write_locked(uris);
    return true;
}

bool JsonFileUriStore::add_uri_string(const std::string& uri) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto uris = read_locked();
    if (std::find(uris.begin(), uris.end(), uri) != uris.end()) return false;
    uris.push_back(uri);
    write_locked(uris);
    return true;
}
