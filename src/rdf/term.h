// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_RDF_TERM_H
#define PROVCHAIN_RDF_TERM_H

#include <string>

extern const char* const XSD_STRING;
extern const char* const RDF_LANGSTRING;

/**
 * An RDF term: IRI, blank node or literal.
 *
 * A blank node id only has meaning inside the graph that contains it.
 * Literals always carry a datatype: xsd:string when none is given,
 * rdf:langString when a language tag is present.
 */
class CTerm {
public:
    enum class Type {
        IRI,
        BLANK,
        LITERAL
    };

    CTerm() : m_type(Type::IRI) {}

    static CTerm Iri(const std::string& iri);
    static CTerm Blank(const std::string& id);
    static CTerm Literal(const std::string& lexical);
    static CTerm LangLiteral(const std::string& lexical, const std::string& language);
    static CTerm TypedLiteral(const std::string& lexical, const std::string& datatype);

    Type GetType() const { return m_type; }
    bool IsIRI() const { return m_type == Type::IRI; }
    bool IsBlank() const { return m_type == Type::BLANK; }
    bool IsLiteral() const { return m_type == Type::LITERAL; }

    /** IRI text, blank node id, or literal lexical form */
    const std::string& GetValue() const { return m_value; }
    const std::string& GetDatatype() const { return m_datatype; }
    const std::string& GetLanguage() const { return m_language; }

    /**
     * Canonical N-Triples form.
     * @throws SerializationError if the term is malformed
     */
    std::string ToNTriples() const;

    bool operator==(const CTerm& other) const;
    bool operator!=(const CTerm& other) const { return !(*this == other); }
    bool operator<(const CTerm& other) const;

private:
    CTerm(Type type, const std::string& value, const std::string& datatype,
          const std::string& language)
        : m_type(type), m_value(value), m_datatype(datatype), m_language(language) {}

    Type m_type;
    std::string m_value;
    std::string m_datatype;
    std::string m_language;
};

/**
 * (subject, predicate, object). The predicate is always an IRI and the
 * subject is never a literal.
 */
struct CTriple {
    CTerm subject;
    CTerm predicate;
    CTerm object;

    CTriple() {}
    CTriple(const CTerm& s, const CTerm& p, const CTerm& o)
        : subject(s), predicate(p), object(o) {}

    bool IsValid() const {
        return predicate.IsIRI() && !subject.IsLiteral();
    }

    /**
     * "<s> <p> <o> ." without trailing newline.
     * @throws SerializationError if the triple or one of its terms is malformed
     */
    std::string ToNTriples() const;

    bool operator==(const CTriple& other) const;
    bool operator<(const CTriple& other) const;
};

/** Escape a literal lexical form the way canonical N-Triples requires */
std::string EscapeLiteral(const std::string& lexical);

/** Validation helpers; each returns false and sets error on malformed input */
bool CheckIRI(const std::string& iri, std::string& error);
bool CheckBlankNodeId(const std::string& id, std::string& error);
bool CheckLanguageTag(const std::string& tag, std::string& error);

#endif // PROVCHAIN_RDF_TERM_H
