// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <rdf/ntriples.h>
#include <core/errors.h>
#include <util/strencodings.h>

#include <cctype>
#include <sstream>

namespace {

void AppendUTF8(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/** Reads a single N-Triples statement from one line */
class CStatementReader {
public:
    explicit CStatementReader(const std::string& line) : m_line(line), m_pos(0) {}

    /**
     * @param empty Set when the line holds no statement (blank or comment)
     */
    bool Read(CTriple& triple, bool& empty, std::string& error) {
        empty = false;
        SkipWhitespace();
        if (AtEnd() || Peek() == '#') {
            empty = true;
            return true;
        }

        // Subject
        if (Peek() == '<') {
            std::string iri;
            if (!ReadIRI(iri, error)) return false;
            triple.subject = CTerm::Iri(iri);
        } else if (Peek() == '_') {
            std::string id;
            if (!ReadBlank(id, error)) return false;
            triple.subject = CTerm::Blank(id);
        } else {
            error = "expected IRI or blank node as subject";
            return false;
        }

        // Predicate
        SkipWhitespace();
        if (AtEnd() || Peek() != '<') {
            error = "expected IRI as predicate";
            return false;
        }
        std::string predicate;
        if (!ReadIRI(predicate, error)) return false;
        triple.predicate = CTerm::Iri(predicate);

        // Object
        SkipWhitespace();
        if (AtEnd()) {
            error = "missing object";
            return false;
        }
        if (Peek() == '<') {
            std::string iri;
            if (!ReadIRI(iri, error)) return false;
            triple.object = CTerm::Iri(iri);
        } else if (Peek() == '_') {
            std::string id;
            if (!ReadBlank(id, error)) return false;
            triple.object = CTerm::Blank(id);
        } else if (Peek() == '"') {
            if (!ReadLiteral(triple.object, error)) return false;
        } else {
            error = "expected IRI, blank node or literal as object";
            return false;
        }

        SkipWhitespace();
        if (AtEnd() || Peek() != '.') {
            error = "expected '.' at end of statement";
            return false;
        }
        m_pos++;
        SkipWhitespace();
        if (!AtEnd() && Peek() != '#') {
            error = "unexpected characters after '.'";
            return false;
        }
        return true;
    }

private:
    const std::string& m_line;
    size_t m_pos;

    bool AtEnd() const { return m_pos >= m_line.size(); }
    char Peek() const { return m_line[m_pos]; }

    void SkipWhitespace() {
        while (!AtEnd() && (Peek() == ' ' || Peek() == '\t')) m_pos++;
    }

    bool ReadUnicodeEscape(size_t digits, std::string& out, std::string& error) {
        if (m_pos + digits > m_line.size()) {
            error = "truncated unicode escape";
            return false;
        }
        uint32_t cp = 0;
        for (size_t i = 0; i < digits; i++) {
            int8_t v = HexDigit(m_line[m_pos + i]);
            if (v < 0) {
                error = "invalid hex digit in unicode escape";
                return false;
            }
            cp = (cp << 4) | static_cast<uint32_t>(v);
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            error = "unicode escape out of range";
            return false;
        }
        m_pos += digits;
        AppendUTF8(cp, out);
        return true;
    }

    bool ReadIRI(std::string& iri, std::string& error) {
        m_pos++;  // '<'
        iri.clear();
        while (!AtEnd()) {
            char c = m_line[m_pos++];
            if (c == '>') {
                return true;
            }
            if (c == '\\') {
                if (AtEnd()) break;
                char e = m_line[m_pos++];
                if (e == 'u') {
                    if (!ReadUnicodeEscape(4, iri, error)) return false;
                } else if (e == 'U') {
                    if (!ReadUnicodeEscape(8, iri, error)) return false;
                } else {
                    error = "invalid escape in IRI";
                    return false;
                }
                continue;
            }
            iri += c;
        }
        error = "unterminated IRI";
        return false;
    }

    bool ReadBlank(std::string& id, std::string& error) {
        if (m_pos + 1 >= m_line.size() || m_line[m_pos + 1] != ':') {
            error = "expected '_:' blank node prefix";
            return false;
        }
        m_pos += 2;
        size_t start = m_pos;
        while (!AtEnd()) {
            unsigned char c = static_cast<unsigned char>(Peek());
            if (!isalnum(c) && c != '_' && c != '-' && c != '.') break;
            m_pos++;
        }
        // A trailing '.' terminates the statement, not the label
        while (m_pos > start && m_line[m_pos - 1] == '.') m_pos--;
        if (m_pos == start) {
            error = "empty blank node label";
            return false;
        }
        id = m_line.substr(start, m_pos - start);
        return true;
    }

    bool ReadLiteral(CTerm& term, std::string& error) {
        m_pos++;  // opening quote
        std::string lexical;
        bool closed = false;
        while (!AtEnd()) {
            char c = m_line[m_pos++];
            if (c == '"') {
                closed = true;
                break;
            }
            if (c != '\\') {
                lexical += c;
                continue;
            }
            if (AtEnd()) break;
            char e = m_line[m_pos++];
            switch (e) {
                case 't': lexical += '\t'; break;
                case 'b': lexical += '\b'; break;
                case 'n': lexical += '\n'; break;
                case 'r': lexical += '\r'; break;
                case 'f': lexical += '\f'; break;
                case '"': lexical += '"'; break;
                case '\'': lexical += '\''; break;
                case '\\': lexical += '\\'; break;
                case 'u':
                    if (!ReadUnicodeEscape(4, lexical, error)) return false;
                    break;
                case 'U':
                    if (!ReadUnicodeEscape(8, lexical, error)) return false;
                    break;
                default:
                    error = std::string("invalid escape '\\") + e + "' in literal";
                    return false;
            }
        }
        if (!closed) {
            error = "unterminated literal";
            return false;
        }

        if (!AtEnd() && Peek() == '@') {
            m_pos++;
            size_t start = m_pos;
            while (!AtEnd() && (isalnum(static_cast<unsigned char>(Peek())) || Peek() == '-')) m_pos++;
            std::string language = m_line.substr(start, m_pos - start);
            if (language.empty()) {
                error = "empty language tag after '@'";
                return false;
            }
            if (!CheckLanguageTag(language, error)) return false;
            term = CTerm::LangLiteral(lexical, language);
            return true;
        }
        if (m_pos + 1 < m_line.size() && Peek() == '^' && m_line[m_pos + 1] == '^') {
            m_pos += 2;
            if (AtEnd() || Peek() != '<') {
                error = "expected datatype IRI after '^^'";
                return false;
            }
            std::string datatype;
            if (!ReadIRI(datatype, error)) return false;
            if (datatype == RDF_LANGSTRING) {
                error = "rdf:langString literal requires a language tag";
                return false;
            }
            term = CTerm::TypedLiteral(lexical, datatype);
            return true;
        }
        term = CTerm::Literal(lexical);
        return true;
    }
};

} // namespace

bool ParseNTriples(const std::string& text, std::vector<CTriple>& triples, std::string& error) {
    triples.clear();

    std::istringstream stream(text);
    std::string line;
    int line_number = 0;
    while (std::getline(stream, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        CTriple triple;
        bool empty = false;
        std::string reason;
        CStatementReader reader(line);
        if (!reader.Read(triple, empty, reason)) {
            error = strprintf("line %d: %s", line_number, reason.c_str());
            return false;
        }
        if (empty) {
            continue;
        }

        // Reject terms that cannot be written back out canonically
        try {
            (void)triple.ToNTriples();
        } catch (const SerializationError& e) {
            error = strprintf("line %d: %s", line_number, e.what());
            return false;
        }
        triples.push_back(triple);
    }
    return true;
}

bool ParseNTriples(const std::string& text, CGraph& graph, std::string& error) {
    std::vector<CTriple> triples;
    if (!ParseNTriples(text, triples, error)) {
        return false;
    }
    graph.Clear();
    for (const CTriple& triple : triples) {
        graph.Insert(triple);
    }
    return true;
}

std::string SerializeNTriples(const std::vector<CTriple>& triples) {
    std::string out;
    for (const CTriple& triple : triples) {
        out += triple.ToNTriples();
        out += '\n';
    }
    return out;
}

std::string SerializeNTriples(const CGraph& graph) {
    return SerializeNTriples(graph.GetTriples());
}
