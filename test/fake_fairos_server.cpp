#include "fake_fairos_server.hpp"

#include <cctype>
#include <chrono>
#include <sstream>
#include "fairos/utils/tools.hpp"

namespace fairos {
namespace testing {

namespace {

const std::string API_PREFIX = "/v1";
const std::string COOKIE_NAME = "fairOS-dfs";

void reply(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void fail(httplib::Response& res, int status, const std::string& message) {
    reply(res, status, {{"message", message}, {"code", status}});
}

void ok(httplib::Response& res, const std::string& message) {
    reply(res, 200, {{"message", message}, {"code", 200}});
}

json parseBody(const httplib::Request& req) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return json::object();
    }
    return body;
}

std::string stringField(const json& body, const std::string& field) {
    if (body.contains(field) && body.at(field).is_string()) {
        return body.at(field).get<std::string>();
    }
    return "";
}

std::string formField(const std::vector<FormPart>& parts, const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name) {
            return part.content;
        }
    }
    return "";
}

const FormPart* formFile(const std::vector<FormPart>& parts, const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name && !part.filename.empty()) {
            return &part;
        }
    }
    return nullptr;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool isDigits(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// 操作数求值：字符串字面量、数字字面量或字段引用
json operand(const std::string& text, const json& doc) {
    std::string t = trim(text);
    if (t.size() >= 2 && t.front() == '"' && t.back() == '"') {
        return t.substr(1, t.size() - 2);
    }
    if (isDigits(t)) {
        return std::stoull(t);
    }
    if (doc.is_object() && doc.contains(t)) {
        return doc.at(t);
    }
    return nullptr;
}

int compare(const json& a, const json& b, bool& comparable) {
    comparable = true;
    if (a.is_number() && b.is_number()) {
        double x = a.get<double>();
        double y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        return a.get<std::string>().compare(b.get<std::string>());
    }
    comparable = false;
    return 0;
}

} // namespace

std::string PercentDecode(const std::string& text) {
    std::string out;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

std::map<std::string, std::string> ParseRawQuery(const std::string& target) {
    std::map<std::string, std::string> query;
    size_t q = target.find('?');
    if (q == std::string::npos) {
        return query;
    }
    std::stringstream ss(target.substr(q + 1));
    std::string item;
    while (std::getline(ss, item, '&')) {
        if (item.empty()) {
            continue;
        }
        // 只在第一个'='处切分，值中可能还有'='
        size_t eq = item.find('=');
        if (eq == std::string::npos) {
            query[PercentDecode(item)] = "";
        } else {
            query[PercentDecode(item.substr(0, eq))] = PercentDecode(item.substr(eq + 1));
        }
    }
    return query;
}

bool MatchExpression(const std::string& expr, const json& doc) {
    std::string e = trim(expr);
    if (e.empty()) {
        return true;
    }
    const std::string ops[] = {">=", ">", "="};
    for (const auto& op : ops) {
        size_t pos = e.find(op);
        if (pos == std::string::npos) {
            continue;
        }
        json lhs = operand(e.substr(0, pos), doc);
        json rhs = operand(e.substr(pos + op.size()), doc);
        bool comparable = false;
        int c = compare(lhs, rhs, comparable);
        if (!comparable) {
            return false;
        }
        if (op == ">=") return c >= 0;
        if (op == ">") return c > 0;
        return c == 0;
    }
    return false;
}

FakeFairosServer::FakeFairosServer() {
    setupRoutes();
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

FakeFairosServer::~FakeFairosServer() {
    server_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string FakeFairosServer::BaseURL() const {
    return "http://127.0.0.1:" + std::to_string(port_) + API_PREFIX;
}

std::string FakeFairosServer::tableKey(const std::string& user, const std::string& pod, const std::string& table) {
    return user + "/" + pod + "/" + table;
}

void FakeFairosServer::SeedKv(const std::string& user, const std::string& pod, const std::string& table,
                              const std::map<std::string, std::string>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& kv = kv_[tableKey(user, pod, table)];
    if (kv.indexType.empty()) {
        kv.indexType = "string";
    }
    for (const auto& entry : entries) {
        kv.entries[entry.first] = entry.second;
    }
}

void FakeFairosServer::SetStatusReply(int status, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusCode_ = status;
    statusBody_ = body;
}

void FakeFairosServer::IgnoreSeekLimit(bool ignore) {
    std::lock_guard<std::mutex> lock(mutex_);
    ignoreSeekLimit_ = ignore;
}

std::optional<std::string> FakeFairosServer::TokenFor(const std::string& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latestTokens_.find(user);
    if (it == latestTokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<UploadRecord> FakeFairosServer::LastUpload() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastUpload_;
}

std::optional<json> FakeFairosServer::LastSeekRequest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSeek_;
}

std::vector<FormPart> FakeFairosServer::LastLoadForm() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastLoadForm_;
}

std::string FakeFairosServer::LastRawQuery() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastRawQuery_;
}

std::vector<json> FakeFairosServer::Documents(const std::string& user, const std::string& pod,
                                              const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = docs_.find(tableKey(user, pod, table));
    if (it == docs_.end()) {
        return {};
    }
    return it->second.docs;
}

size_t FakeFairosServer::SeekNextCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seekNextCalls_;
}

std::string FakeFairosServer::issueToken(const std::string& user) {
    std::string token = "session-" + std::to_string(++tokenCounter_) + "-" + user;
    sessions_[token] = user;
    latestTokens_[user] = token;
    return token;
}

std::optional<std::string> FakeFairosServer::authenticate(const httplib::Request& req, httplib::Response& res) {
    std::string cookie = req.get_header_value("Cookie");
    const std::string prefix = COOKIE_NAME + "=";
    size_t pos = cookie.find(prefix);
    if (pos == std::string::npos) {
        fail(res, 400, "cookie: cookie not set");
        return std::nullopt;
    }
    std::string token = cookie.substr(pos + prefix.size());
    token = token.substr(0, token.find(';'));
    auto it = sessions_.find(trim(token));
    if (it == sessions_.end()) {
        fail(res, 400, "cookie: invalid cookie");
        return std::nullopt;
    }
    return it->second;
}

void FakeFairosServer::setupRoutes() {
    // multipart接口
    auto formHandler = [this](const httplib::Request& req, httplib::Response& res,
                              const httplib::ContentReader& reader) {
        std::vector<FormPart> parts;
        reader(
            [&](const auto& header) {
                FormPart part;
                part.name = header.name;
                part.filename = header.filename;
                part.contentType = header.content_type;
                parts.push_back(part);
                return true;
            },
            [&](const char* data, size_t length) {
                if (!parts.empty()) {
                    parts.back().content.append(data, length);
                }
                return true;
            });
        std::lock_guard<std::mutex> lock(mutex_);
        handleForm(req, res, parts);
    };
    server_.Post(API_PREFIX + "/file/upload", formHandler);
    server_.Post(API_PREFIX + "/file/download", formHandler);
    server_.Post(API_PREFIX + "/kv/loadcsv", formHandler);
    server_.Post(API_PREFIX + "/doc/loadjson", formHandler);

    server_.Get(API_PREFIX + "/test/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(3000));
        reply(res, 200, json::object());
    });

    server_.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mutex_);
        handle("GET", req, res);
    });
    server_.Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mutex_);
        handle("POST", req, res);
    });
    server_.Delete(".*", [this](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mutex_);
        handle("DELETE", req, res);
    });
}

void FakeFairosServer::handleForm(const httplib::Request& req, httplib::Response& res,
                                  const std::vector<FormPart>& parts) {
    auto user = authenticate(req, res);
    if (!user) {
        return;
    }
    const std::string path = req.path.substr(API_PREFIX.size());
    const std::string pod = formField(parts, "pod_name");
    if (!pods_.count(*user + "/" + pod)) {
        fail(res, 400, "pod: pod not open");
        return;
    }

    if (path == "/file/upload") {
        const FormPart* file = formFile(parts, "files");
        if (!file) {
            fail(res, 400, "file upload: no files");
            return;
        }
        std::string dir = formField(parts, "dir_path");
        std::string filePath = (dir == "/" ? "" : dir) + "/" + file->filename;
        files_[*user + "/" + pod + filePath] = file->content;

        UploadRecord record;
        record.path = filePath;
        record.blockSize = formField(parts, "block_size");
        record.contentType = file->contentType;
        if (req.has_header("fairOS-dfs-Compression")) {
            record.compression = req.get_header_value("fairOS-dfs-Compression");
        }
        for (const auto& part : parts) {
            record.fieldOrder.push_back(part.name);
        }
        lastUpload_ = record;
        reply(res, 200, {{"Responses", json::array({{{"file_name", file->filename}, {"message", "uploaded successfully"}}})}});
        return;
    }

    if (path == "/file/download") {
        auto it = files_.find(*user + "/" + pod + formField(parts, "file_path"));
        if (it == files_.end()) {
            fail(res, 404, "download: file not found");
            return;
        }
        res.status = 200;
        res.set_content(it->second, "application/octet-stream");
        return;
    }

    if (path == "/kv/loadcsv") {
        lastLoadForm_ = parts;
        const FormPart* csv = formFile(parts, "csv");
        auto it = kv_.find(tableKey(*user, pod, formField(parts, "table_name")));
        if (!csv || it == kv_.end()) {
            fail(res, 400, "kv loadcsv: table or csv missing");
            return;
        }
        // 首行为表头，其余每行 key,value
        std::stringstream ss(csv->content);
        std::string line;
        bool header = true;
        size_t rows = 0;
        while (std::getline(ss, line)) {
            line = trim(line);
            if (header || line.empty()) {
                header = false;
                continue;
            }
            size_t comma = line.find(',');
            it->second.entries[line.substr(0, comma)] =
                comma == std::string::npos ? "" : line.substr(comma + 1);
            ++rows;
        }
        ok(res, "csv file loaded in to kv table with total:" + std::to_string(rows));
        return;
    }

    if (path == "/doc/loadjson") {
        lastLoadForm_ = parts;
        const FormPart* file = formFile(parts, "json");
        auto it = docs_.find(tableKey(*user, pod, formField(parts, "table_name")));
        if (!file || it == docs_.end()) {
            fail(res, 400, "doc loadjson: table or json missing");
            return;
        }
        std::stringstream ss(file->content);
        std::string line;
        while (std::getline(ss, line)) {
            if (trim(line).empty()) {
                continue;
            }
            json doc = json::parse(line, nullptr, false);
            if (doc.is_discarded()) {
                fail(res, 400, "doc loadjson: invalid json line");
                return;
            }
            it->second.docs.push_back(doc);
        }
        ok(res, "json file loaded in to document db");
        return;
    }

    fail(res, 404, "not found");
}

void FakeFairosServer::handle(const std::string& method, const httplib::Request& req, httplib::Response& res) {
    if (req.path.compare(0, API_PREFIX.size(), API_PREFIX) != 0) {
        fail(res, 404, "not found");
        return;
    }
    const std::string path = req.path.substr(API_PREFIX.size());
    const std::string route = method + " " + path;
    const auto query = ParseRawQuery(req.target);
    lastRawQuery_ = req.target.find('?') == std::string::npos ? "" : req.target.substr(req.target.find('?') + 1);
    const json body = parseBody(req);

    auto param = [&](const std::string& name) -> std::string {
        auto it = query.find(name);
        return it == query.end() ? "" : it->second;
    };

    if (route == "GET /test/status") {
        res.status = statusCode_;
        res.set_content(statusBody_, "application/json");
        return;
    }

    // 用户
    if (route == "POST /user/signup") {
        std::string name = stringField(body, "user_name");
        if (users_.count(name)) {
            fail(res, 400, "user signup: user name already present");
            return;
        }
        std::string serial = std::to_string(users_.size() + 1);
        std::string address = "0x" + std::string(40 - serial.size(), '0') + serial;
        users_[name] = {stringField(body, "password"), address};
        json out = {{"address", users_[name].address}};
        if (body.contains("mnemonic") && body.at("mnemonic").is_string()) {
            out["mnemonic"] = nullptr;
        } else {
            out["mnemonic"] = "abandon ability able about above absent absorb abstract absurd abuse access accident";
        }
        res.set_header("Set-Cookie", COOKIE_NAME + "=" + issueToken(name) + "; Path=/; HttpOnly");
        reply(res, 201, out);
        return;
    }
    if (route == "POST /user/login") {
        std::string name = stringField(body, "user_name");
        auto it = users_.find(name);
        if (it == users_.end()) {
            fail(res, 404, "user login: invalid user name");
            return;
        }
        if (it->second.password != stringField(body, "password")) {
            fail(res, 400, "user login: invalid password");
            return;
        }
        res.set_header("Set-Cookie", COOKIE_NAME + "=" + issueToken(name) + "; Path=/; HttpOnly");
        ok(res, "user logged-in successfully");
        return;
    }
    if (route == "GET /user/present") {
        reply(res, 200, {{"present", users_.count(param("user_name")) > 0}});
        return;
    }
    if (route == "GET /user/isloggedin") {
        bool loggedIn = false;
        for (const auto& session : sessions_) {
            loggedIn = loggedIn || session.second == param("user_name");
        }
        reply(res, 200, {{"loggedin", loggedIn}});
        return;
    }

    auto user = authenticate(req, res);
    if (!user) {
        return;
    }

    if (route == "POST /user/logout") {
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            it = it->second == *user ? sessions_.erase(it) : std::next(it);
        }
        ok(res, "user logged out successfully");
        return;
    }
    if (route == "DELETE /user/delete") {
        if (users_[*user].password != stringField(body, "password")) {
            fail(res, 400, "user delete: invalid password");
            return;
        }
        users_.erase(*user);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            it = it->second == *user ? sessions_.erase(it) : std::next(it);
        }
        ok(res, "user deleted successfully");
        return;
    }

    // Pod
    const std::string pod = method == "GET" ? param("pod_name") : stringField(body, "pod_name");
    const std::string podKey = *user + "/" + pod;
    if (route == "POST /pod/new") {
        if (pods_.count(podKey)) {
            fail(res, 400, "pod new: pod already exists");
            return;
        }
        pods_.insert(podKey);
        dirs_.insert(podKey + "/");
        ok(res, "pod created successfully");
        return;
    }
    if (route == "GET /pod/present") {
        reply(res, 200, {{"present", pods_.count(podKey) > 0}});
        return;
    }
    if (!pods_.count(podKey)) {
        fail(res, 400, "pod: pod does not exist");
        return;
    }
    if (route == "POST /pod/open" || route == "POST /pod/close") {
        ok(res, "pod " + std::string(route == "POST /pod/open" ? "opened" : "closed") + " successfully");
        return;
    }
    if (route == "DELETE /pod/delete") {
        if (users_[*user].password != stringField(body, "password")) {
            fail(res, 400, "pod delete: invalid password");
            return;
        }
        pods_.erase(podKey);
        ok(res, "pod deleted successfully");
        return;
    }

    // 文件系统
    if (route == "POST /dir/mkdir") {
        std::string dir = stringField(body, "dir_path");
        if (dirs_.count(podKey + dir)) {
            fail(res, 400, "mkdir: directory name already present");
            return;
        }
        dirs_.insert(podKey + dir);
        reply(res, 201, {{"message", "directory created successfully"}, {"code", 201}});
        return;
    }
    if (route == "DELETE /file/delete") {
        if (!files_.erase(podKey + stringField(body, "file_path"))) {
            fail(res, 404, "delete: file not present");
            return;
        }
        ok(res, "file deleted successfully");
        return;
    }

    // 键值存储
    const std::string table = method == "GET" ? param("table_name") : stringField(body, "table_name");
    const std::string key = tableKey(*user, pod, table);
    if (route == "POST /kv/new") {
        if (kv_.count(key)) {
            fail(res, 400, "kv new: table already present");
            return;
        }
        kv_[key].indexType = stringField(body, "indexType");
        reply(res, 201, {{"message", "kv store created"}, {"code", 201}});
        return;
    }
    auto kv = kv_.find(key);
    if (path.compare(0, 4, "/kv/") == 0) {
        if (kv == kv_.end()) {
            fail(res, 400, "kv: table not present");
            return;
        }
        KvTable& t = kv->second;
        if (route == "POST /kv/open") {
            ok(res, "kv store opened");
        } else if (route == "DELETE /kv/delete") {
            kv_.erase(kv);
            ok(res, "kv store deleted");
        } else if (route == "POST /kv/entry/put") {
            t.entries[stringField(body, "key")] = stringField(body, "value");
            ok(res, "key added");
        } else if (route == "GET /kv/entry/get") {
            auto it = t.entries.find(param("key"));
            if (it == t.entries.end()) {
                fail(res, 404, "kv get: value not found");
            } else {
                std::string value = param("format") == "byte-string" ? utils::Base64Encode(it->second) : it->second;
                reply(res, 200, {{"keys", json::array({it->first})}, {"values", value}});
            }
        } else if (route == "DELETE /kv/entry/del") {
            if (!t.entries.erase(stringField(body, "key"))) {
                fail(res, 404, "kv del: value not found");
            } else {
                ok(res, "key deleted");
            }
        } else if (route == "POST /kv/count") {
            reply(res, 200, {{"count", t.entries.size()}, {"table_name", table}});
        } else if (route == "GET /kv/present") {
            reply(res, 200, {{"present", t.entries.count(param("key")) > 0}});
        } else if (route == "POST /kv/seek") {
            lastSeek_ = body;
            std::string start = stringField(body, "start_prefix");
            t.cursor.clear();
            t.position = 0;
            for (const auto& entry : t.entries) {
                if (entry.first < start) {
                    continue;
                }
                if (body.contains("end_prefix") && body.at("end_prefix").is_string() &&
                    entry.first > body.at("end_prefix").get<std::string>()) {
                    continue;
                }
                t.cursor.push_back(entry);
            }
            if (!ignoreSeekLimit_ && body.contains("limit") && body.at("limit").is_number_unsigned()) {
                size_t limit = body.at("limit").get<size_t>();
                if (t.cursor.size() > limit) {
                    t.cursor.resize(limit);
                }
            }
            t.seeking = true;
            ok(res, "seeked closest to the start key");
        } else if (route == "GET /kv/seek/next") {
            ++seekNextCalls_;
            if (!t.seeking || t.position >= t.cursor.size()) {
                fail(res, 400, "kv seek next: no next element");
            } else {
                const auto& entry = t.cursor[t.position++];
                reply(res, 200, {{"keys", json::array({entry.first})}, {"values", entry.second}});
            }
        } else {
            fail(res, 404, "not found");
        }
        return;
    }

    // 文档库
    if (route == "POST /doc/new") {
        if (docs_.count(key)) {
            fail(res, 400, "doc new: table already present");
            return;
        }
        DocTable t;
        t.si = stringField(body, "si");
        t.mutableDb = body.contains("mutable") && body.at("mutable").is_boolean() && body.at("mutable").get<bool>();
        docs_[key] = t;
        reply(res, 201, {{"message", "document db created"}, {"code", 201}});
        return;
    }
    auto doc = docs_.find(key);
    if (path.compare(0, 5, "/doc/") == 0) {
        if (doc == docs_.end()) {
            fail(res, 400, "doc: table not present");
            return;
        }
        DocTable& t = doc->second;
        if (route == "POST /doc/open") {
            ok(res, "document store opened");
        } else if (route == "DELETE /doc/delete") {
            docs_.erase(doc);
            ok(res, "document store deleted");
        } else if (route == "POST /doc/entry/put") {
            json entry = json::parse(stringField(body, "doc"), nullptr, false);
            if (entry.is_discarded() || !entry.is_object()) {
                fail(res, 400, "doc put: invalid document");
                return;
            }
            t.docs.push_back(entry);
            ok(res, "added document to db");
        } else if (route == "GET /doc/entry/get") {
            for (const auto& d : t.docs) {
                if (d.value("id", "") == param("id")) {
                    reply(res, 200, {{"doc", utils::Base64Encode(d.dump())}});
                    return;
                }
            }
            fail(res, 404, "doc get: document not found");
        } else if (route == "DELETE /doc/entry/del") {
            std::string id = stringField(body, "id");
            for (auto it = t.docs.begin(); it != t.docs.end(); ++it) {
                if (it->value("id", "") == id) {
                    t.docs.erase(it);
                    ok(res, "deleted document from db");
                    return;
                }
            }
            fail(res, 404, "doc del: document not found");
        } else if (route == "GET /doc/find") {
            json docs = json::array();
            std::string limit = param("limit");
            size_t max = isDigits(limit) ? std::stoul(limit) : t.docs.size();
            for (const auto& d : t.docs) {
                if (docs.size() >= max) {
                    break;
                }
                if (MatchExpression(param("expr"), d)) {
                    docs.push_back(utils::Base64Encode(d.dump()));
                }
            }
            reply(res, 200, {{"docs", docs}});
        } else if (route == "POST /doc/count") {
            std::string expr = PercentDecode(stringField(body, "expr"));
            size_t count = 0;
            for (const auto& d : t.docs) {
                count += MatchExpression(expr, d) ? 1 : 0;
            }
            ok(res, std::to_string(count));
        } else {
            fail(res, 404, "not found");
        }
        return;
    }

    fail(res, 404, "not found");
}

} // namespace testing
} // namespace fairos
