// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <rdf/term.h>
#include <core/errors.h>

#include <cctype>
#include <cstring>
#include <tuple>

const char* const XSD_STRING = "http://www.w3.org/2001/XMLSchema#string";
const char* const RDF_LANGSTRING = "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";

CTerm CTerm::Iri(const std::string& iri) {
    return CTerm(Type::IRI, iri, "", "");
}

CTerm CTerm::Blank(const std::string& id) {
    return CTerm(Type::BLANK, id, "", "");
}

CTerm CTerm::Literal(const std::string& lexical) {
    return CTerm(Type::LITERAL, lexical, XSD_STRING, "");
}

CTerm CTerm::LangLiteral(const std::string& lexical, const std::string& language) {
    return CTerm(Type::LITERAL, lexical, RDF_LANGSTRING, language);
}

CTerm CTerm::TypedLiteral(const std::string& lexical, const std::string& datatype) {
    if (datatype.empty()) {
        return Literal(lexical);
    }
    return CTerm(Type::LITERAL, lexical, datatype, "");
}

bool CheckIRI(const std::string& iri, std::string& error) {
    if (iri.empty()) {
        error = "empty IRI";
        return false;
    }
    for (unsigned char c : iri) {
        if (c <= 0x20 || c == 0x7f || strchr("<>\"{}|^`\\", c) != nullptr) {
            error = "invalid character in IRI <" + iri + ">";
            return false;
        }
    }
    return true;
}

bool CheckBlankNodeId(const std::string& id, std::string& error) {
    if (id.empty()) {
        error = "empty blank node id";
        return false;
    }
    for (unsigned char c : id) {
        if (!isalnum(c) && c != '_' && c != '-' && c != '.') {
            error = "invalid character in blank node id _:" + id;
            return false;
        }
    }
    if (id.back() == '.') {
        error = "blank node id may not end with '.': _:" + id;
        return false;
    }
    return true;
}

bool CheckLanguageTag(const std::string& tag, std::string& error) {
    // [A-Za-z]+ ( '-' [A-Za-z0-9]+ )*
    size_t i = 0;
    while (i < tag.size() && isalpha(static_cast<unsigned char>(tag[i]))) i++;
    if (i == 0) {
        error = "malformed language tag '" + tag + "'";
        return false;
    }
    while (i < tag.size()) {
        if (tag[i] != '-') {
            error = "malformed language tag '" + tag + "'";
            return false;
        }
        size_t start = ++i;
        while (i < tag.size() && isalnum(static_cast<unsigned char>(tag[i]))) i++;
        if (i == start) {
            error = "malformed language tag '" + tag + "'";
            return false;
        }
    }
    return true;
}

std::string EscapeLiteral(const std::string& lexical) {
    std::string out;
    out.reserve(lexical.size() + 2);
    for (char c : lexical) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string CTerm::ToNTriples() const {
    std::string error;
    switch (m_type) {
        case Type::IRI:
            if (!CheckIRI(m_value, error)) throw SerializationError(error);
            return "<" + m_value + ">";

        case Type::BLANK:
            if (!CheckBlankNodeId(m_value, error)) throw SerializationError(error);
            return "_:" + m_value;

        case Type::LITERAL: {
            std::string out = "\"" + EscapeLiteral(m_value) + "\"";
            if (!m_language.empty()) {
                if (!CheckLanguageTag(m_language, error)) throw SerializationError(error);
                return out + "@" + m_language;
            }
            if (m_datatype == RDF_LANGSTRING) {
                throw SerializationError("rdf:langString literal \"" + m_value + "\" has no language tag");
            }
            if (m_datatype != XSD_STRING) {
                if (!CheckIRI(m_datatype, error)) throw SerializationError("literal datatype: " + error);
                out += "^^<" + m_datatype + ">";
            }
            return out;
        }
    }
    throw SerializationError("unknown term type");
}

bool CTerm::operator==(const CTerm& other) const {
    return m_type == other.m_type && m_value == other.m_value &&
           m_datatype == other.m_datatype && m_language == other.m_language;
}

bool CTerm::operator<(const CTerm& other) const {
    return std::tie(m_type, m_value, m_datatype, m_language) <
           std::tie(other.m_type, other.m_value, other.m_datatype, other.m_language);
}

std::string CTriple::ToNTriples() const {
    if (!predicate.IsIRI()) {
        throw SerializationError("predicate must be an IRI");
    }
    if (subject.IsLiteral()) {
        throw SerializationError("subject may not be a literal");
    }
    return subject.ToNTriples() + " " + predicate.ToNTriples() + " " + object.ToNTriples() + " .";
}

bool CTriple::operator==(const CTriple& other) const {
    return subject == other.subject && predicate == other.predicate && object == other.object;
}

bool CTriple::operator<(const CTriple& other) const {
    return std::tie(subject, predicate, object) <
           std::tie(other.subject, other.predicate, other.object);
}
