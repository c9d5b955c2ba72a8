#include "domain/ContentResource.hpp"
#include <iterator>
#include <string>
#include "domain/ContentErrors.hpp"

namespace omnisplit::domain {

namespace fs = std::filesystem;

ContentResource::ContentResource(fs::path path) : m_path(std::move(path)) {
    std::error_code ec;
    m_size = fs::file_size(m_path, ec);
    if (ec) {
        throw ResourceAccessError("Cannot access " + m_path.string() + ": " + ec.message());
    }
}

std::unique_ptr<std::ifstream> ContentResource::open() const {
    auto stream = std::make_unique<std::ifstream>(m_path, std::ios::binary);
    if (!stream->is_open()) {
        throw ResourceAccessError("Cannot open " + m_path.string());
    }
    return stream;
}

std::vector<std::uint8_t> ContentResource::readAll() const {
    auto stream = open();
    std::string buffer((std::istreambuf_iterator<char>(*stream)), std::istreambuf_iterator<char>());
    if (buffer.size() != static_cast<size_t>(m_size)) {
        throw ResourceAccessError("Short read on " + m_path.string());
    }
    return std::vector<std::uint8_t>(buffer.begin(), buffer.end());
}

} // namespace omnisplit::domain
