/**
 * @file SourceTree.cpp
 * @brief Rendering of the editable source tree.
 */

#include "domain/SourceTree.hpp"

namespace archmend::domain {

std::string Member::render() const {
    if (!edited || !hasBody) {
        return text;
    }
    std::string out = bodyHead;
    for (const auto& statement : statements) {
        out += statement.text;
    }
    out += bodyTail;
    return out;
}

std::string TypeDeclaration::render() const {
    if (!edited) {
        return text;
    }
    std::string out = head;
    for (const auto& member : members) {
        out += member.render();
    }
    out += tail;
    return out;
}

const Member* TypeDeclaration::findCallable(const std::string& memberName) const {
    for (const auto& member : members) {
        if (member.isCallable() && member.name == memberName) {
            return &member;
        }
    }
    return nullptr;
}

std::string ParsedUnit::render() const {
    std::string out = preamble;
    for (const auto& type : types) {
        out += type.render();
    }
    out += trailer;
    return out;
}

TypeDeclaration* ParsedUnit::findType(const std::string& typeName) {
    for (auto& type : types) {
        if (type.name == typeName) {
            return &type;
        }
    }
    return nullptr;
}

} // namespace archmend::domain
