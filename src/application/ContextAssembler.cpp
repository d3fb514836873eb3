/**
 * @file ContextAssembler.cpp
 * @brief Implementation of the ContextAssembler.
 */

#include "application/ContextAssembler.hpp"
#include "application/Utf8.hpp"
#include <sstream>

namespace archmend::application {

ContextAssembler::ContextAssembler(std::shared_ptr<const RagService> rag, RetrievalSettings settings)
    : m_rag(std::move(rag)), m_settings(std::move(settings)) {}

std::string ContextAssembler::buildQuery(const domain::Chunk& chunk) const {
    return m_settings.queryPrefix + Utf8Prefix(chunk.text, m_settings.queryChars);
}

ContextBundle ContextAssembler::gather(const domain::Chunk& chunk) const {
    ContextBundle bundle;
    if (!m_rag || !m_rag->isAvailable()) {
        return bundle;
    }
    bundle.documents = m_rag->retrieve(buildQuery(chunk), m_settings.topK);
    return bundle;
}

std::string ContextAssembler::assemble(const domain::Chunk& chunk, size_t topK) const {
    if (!m_rag || !m_rag->isAvailable() || topK == 0) {
        return "";
    }
    ContextBundle bundle;
    bundle.documents = m_rag->retrieve(buildQuery(chunk), topK);
    return bundle.render();
}

std::string ContextBundle::render() const {
    std::stringstream ss;
    for (const auto& doc : documents) {
        ss << "--- " << doc.title << " ---\n"
           << doc.content << "\n\n";
    }
    return ss.str();
}

} // namespace archmend::application
