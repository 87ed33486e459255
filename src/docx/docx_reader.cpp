#include "docx/docx_reader.hpp"

#include <climits>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include "docx/zip_archive.hpp"
#include "util/utf8.hpp"

namespace taktkb {
namespace {

constexpr const char* kDocumentPart = "word/document.xml";
constexpr const char* kWordNamespace =
    "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

class LibXmlRuntime {
public:
    LibXmlRuntime() { xmlInitParser(); }
    ~LibXmlRuntime() { xmlCleanupParser(); }

    LibXmlRuntime(const LibXmlRuntime&) = delete;
    LibXmlRuntime& operator=(const LibXmlRuntime&) = delete;
};

LibXmlRuntime& libxml_runtime() {
    static LibXmlRuntime runtime;
    return runtime;
}

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* value) const { xmlFree(value); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

bool has_name(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

bool is_word_element(const xmlNode* node, const char* name) {
    return has_name(node, name) && node->ns != nullptr && node->ns->href != nullptr &&
           std::strcmp(reinterpret_cast<const char*>(node->ns->href), kWordNamespace) == 0;
}

// Drawings, VML shapes and text boxes carry their own paragraphs, which are not part
// of the surrounding body paragraph.
bool is_embedded_content(const xmlNode* node) {
    return has_name(node, "drawing") || has_name(node, "pict") ||
           has_name(node, "AlternateContent") || has_name(node, "txbxContent");
}

std::string break_text(const xmlNode* node) {
    XmlCharPtr type(xmlGetNsProp(node, reinterpret_cast<const xmlChar*>("type"),
                                 reinterpret_cast<const xmlChar*>(kWordNamespace)));
    if (!type || std::strcmp(reinterpret_cast<const char*>(type.get()), "textWrapping") == 0) {
        return "\n";
    }
    // Page and column breaks carry no text.
    return {};
}

void append_run_text(const xmlNode* parent, std::string& out) {
    for (const xmlNode* child = parent->children; child != nullptr; child = child->next) {
        if (child->type != XML_ELEMENT_NODE || is_embedded_content(child)) {
            continue;
        }
        if (is_word_element(child, "t")) {
            XmlCharPtr content(xmlNodeGetContent(child));
            if (content) {
                out += reinterpret_cast<const char*>(content.get());
            }
        } else if (is_word_element(child, "tab") || is_word_element(child, "ptab")) {
            out.push_back('\t');
        } else if (is_word_element(child, "br")) {
            out += break_text(child);
        } else if (is_word_element(child, "cr")) {
            out.push_back('\n');
        } else if (is_word_element(child, "noBreakHyphen")) {
            out.push_back('-');
        } else {
            append_run_text(child, out);
        }
    }
}

const xmlNode* find_body(const xmlNode* root) {
    for (const xmlNode* child = root->children; child != nullptr; child = child->next) {
        if (is_word_element(child, "body")) {
            return child;
        }
    }
    return nullptr;
}

}  // namespace

std::vector<std::string> extract_docx_paragraphs(std::string_view document_xml) {
    (void)libxml_runtime();
    if (document_xml.size() > static_cast<std::size_t>(INT_MAX)) {
        throw std::runtime_error("docx: document part too large");
    }

    XmlDocPtr doc(xmlReadMemory(document_xml.data(), static_cast<int>(document_xml.size()),
                                kDocumentPart, nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR |
                                                            XML_PARSE_NOWARNING));
    if (!doc) {
        throw std::runtime_error("docx: malformed document.xml");
    }
    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (root == nullptr || !is_word_element(root, "document")) {
        throw std::runtime_error("docx: document.xml has no w:document root");
    }
    const xmlNode* body = find_body(root);
    if (body == nullptr) {
        throw std::runtime_error("docx: document.xml has no w:body");
    }

    std::vector<std::string> paragraphs;
    for (const xmlNode* child = body->children; child != nullptr; child = child->next) {
        if (!is_word_element(child, "p")) {
            continue;
        }
        std::string text;
        append_run_text(child, text);
        text = utf8::trim(text);
        if (!text.empty()) {
            paragraphs.push_back(std::move(text));
        }
    }
    return paragraphs;
}

std::vector<std::string> read_docx_paragraphs(const std::string& path) {
    const ZipArchive archive = ZipArchive::open_file(path);
    if (!archive.contains(kDocumentPart)) {
        throw std::runtime_error("docx: " + path + " has no " + kDocumentPart);
    }
    return extract_docx_paragraphs(archive.read(kDocumentPart));
}

}  // namespace taktkb
