#include "Renderer.hpp"

#include <fmt/format.h>

void Renderer::emit(const std::string& data) const {
    fmt::print(m_out, "{}", data);
    fflush(m_out);
}
