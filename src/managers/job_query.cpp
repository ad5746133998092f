#include "job_query.hpp"
#include <fmt/format.h>
#include <fstream>

JobRecord JobQuery::get_job(const std::string& id) const {
    return registry_.get(id);
}

std::string JobQuery::download_log(const std::string& id) const {
    JobRecord rec = registry_.get(id);
    std::string out;
    for (size_t i = 0; i < rec.logs.size(); i++) {
        if (i > 0) out += '\n';
        out += rec.logs[i];
    }
    return out;
}

JobQuery::LogChunk JobQuery::logs_since(const std::string& id, size_t offset) const {
    LogChunk chunk;
    chunk.lines = registry_.logs_since(id, offset, &chunk.status);
    chunk.next_offset = offset + chunk.lines.size();
    return chunk;
}

Result<void> JobQuery::save_log(const std::string& id, const fs::path& path) const {
    std::string content = download_log(id);

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(fmt::format("Cannot create {}: {}",
                                                 path.parent_path().string(), ec.message()));
        }
    }

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        return Result<void>::Err("Cannot write " + path.string());
    }
    f << content;
    if (!content.empty()) f << "\n";
    if (!f) {
        return Result<void>::Err("Write failed for " + path.string());
    }
    return Result<void>::Ok();
}

std::string JobQuery::log_file_name(const std::string& id) {
    return fmt::format("migration_{}.log", id);
}
