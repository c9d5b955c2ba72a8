/**
 * @file ZipArchive.cpp
 * @brief libzip-backed ZipReader and ZipWriter.
 */

#include "infrastructure/ZipArchive.hpp"
#include <stdexcept>
#include <zip.h>

namespace omnisplit::infrastructure {

namespace {
    std::string OpenErrorMessage(int errcode) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        std::string msg = zip_error_strerror(&ze);
        zip_error_fini(&ze);
        return msg;
    }

    std::string ArchiveError(zip_t* archive) {
        return zip_error_strerror(zip_get_error(archive));
    }
}

ZipReader::ZipReader(const std::filesystem::path& path) {
    int errcode = 0;
    m_archive = zip_open(path.string().c_str(), ZIP_RDONLY, &errcode);
    if (!m_archive) {
        throw std::runtime_error("zip_open failed for " + path.string() + ": " + OpenErrorMessage(errcode));
    }
}

ZipReader::~ZipReader() {
    if (m_archive) zip_discard(m_archive);
}

bool ZipReader::contains(const std::string& name) const {
    return zip_name_locate(m_archive, name.c_str(), 0) >= 0;
}

std::string ZipReader::read(const std::string& name) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(m_archive, name.c_str(), 0, &st) != 0) {
        throw std::runtime_error("zip_stat failed: " + name);
    }

    zip_file_t* f = zip_fopen(m_archive, name.c_str(), 0);
    if (!f) {
        throw std::runtime_error("zip_fopen failed: " + name);
    }

    std::string buf(static_cast<size_t>(st.size), '\0');
    zip_int64_t n = buf.empty() ? 0 : zip_fread(f, &buf[0], st.size);
    zip_fclose(f);

    if (n < 0 || static_cast<zip_uint64_t>(n) != st.size) {
        throw std::runtime_error("zip_fread incomplete: " + name);
    }
    return buf;
}

std::vector<std::string> ZipReader::entryNames() const {
    std::vector<std::string> names;
    zip_int64_t count = zip_get_num_entries(m_archive, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        const char* name = zip_get_name(m_archive, static_cast<zip_uint64_t>(i), 0);
        if (name) names.emplace_back(name);
    }
    return names;
}

ZipWriter::ZipWriter(const std::filesystem::path& path) {
    int errcode = 0;
    m_archive = zip_open(path.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &errcode);
    if (!m_archive) {
        throw std::runtime_error("zip_open failed for " + path.string() + ": " + OpenErrorMessage(errcode));
    }
}

ZipWriter::~ZipWriter() {
    if (m_archive) zip_discard(m_archive);
}

void ZipWriter::add(const std::string& name, std::string data, bool stored) {
    if (!m_archive) throw std::runtime_error("ZipWriter already closed");

    m_buffers.push_back(std::move(data));
    const std::string& buffer = m_buffers.back();

    zip_source_t* source = zip_source_buffer(m_archive, buffer.data(), buffer.size(), 0);
    if (!source) {
        throw std::runtime_error("zip_source_buffer failed for " + name + ": " + ArchiveError(m_archive));
    }

    zip_int64_t index = zip_file_add(m_archive, name.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
    if (index < 0) {
        zip_source_free(source);
        throw std::runtime_error("zip_file_add failed for " + name + ": " + ArchiveError(m_archive));
    }

    auto idx = static_cast<zip_uint64_t>(index);
    if (zip_set_file_compression(m_archive, idx, stored ? ZIP_CM_STORE : ZIP_CM_DEFLATE, 0) != 0) {
        throw std::runtime_error("zip_set_file_compression failed for " + name + ": " + ArchiveError(m_archive));
    }
    if (zip_file_set_mtime(m_archive, idx, kFixedMtime, 0) != 0) {
        throw std::runtime_error("zip_file_set_mtime failed for " + name + ": " + ArchiveError(m_archive));
    }
}

void ZipWriter::close() {
    if (!m_archive) return;
    if (zip_close(m_archive) != 0) {
        std::string message = ArchiveError(m_archive);
        zip_discard(m_archive);
        m_archive = nullptr;
        m_buffers.clear();
        throw std::runtime_error("zip_close failed: " + message);
    }
    m_archive = nullptr;
    m_buffers.clear();
}

} // namespace omnisplit::infrastructure
