#include "redline/xml-utils.h"
#include "redline/errors.h"
#include <sstream>
#include <cstring>
#include <algorithm>

using namespace std;
using namespace pugi;

namespace redline {

void loadXML(xml_document& doc, const string& filename)
{
    xml_parse_result result = doc.load_file(filename.c_str(), PARSE_OPTIONS);
    if (!result)
    {
        cerr << "XML parsed with errors: " << filename << "\n";
        cerr << "Error description: " << result.description() << "\n";
        cerr << "Error offset: " << result.offset << "\n\n";
        throw RedlineException(ErrorKind::Input, ErrorType::BadXML, string(result.description()), filename);
    }
}

void loadXMLString(xml_document& doc, const string& xml)
{
    xml_parse_result result = doc.load_buffer(xml.data(), xml.size(), PARSE_OPTIONS);
    if (!result)
    {
        throw RedlineException(ErrorKind::Input, ErrorType::BadXML,
            string(result.description())+" at offset "+to_string(result.offset));
    }
}

string saveXML(const xml_node& doc)
{
    ostringstream os;
    if (doc.type()==node_document) {
        doc.print(os, "", format_raw);
    } else {
        doc.print(os, "", format_raw|format_no_declaration);
    }
    return os.str();
}

static xml_node find_descendant(const xml_node& node, const char* name)
{
    for (xml_node child: node.children()) {
        if (child.type()!=node_element) {
            continue;
        }
        if (strcmp(child.name(), name)==0) {
            return child;
        }
        xml_node res = find_descendant(child, name);
        if (res) {
            return res;
        }
    }
    return xml_node();
}

xml_node find_body(const xml_node& root)
{
    if (is_element(root, "w:body")) {
        return root;
    }
    xml_node body = find_descendant(root, "w:body");
    if (!body) {
        throw RedlineException(ErrorKind::Input, ErrorType::BodyNotFound, "Could not find w:body in document");
    }
    return body;
}

string getLeafText(const xml_node& node)
{
    if (node.type()==node_pcdata || node.type()==node_cdata) {
        return node.value();
    }
    string res;
    for (xml_node child: node.children()) {
        if (child.type()==node_pcdata || child.type()==node_cdata) {
            res+=child.value();
        }
    }
    return res;
}

void setLeafText(xml_node node, const string& text)
{
    while (node.first_child()) {
        node.remove_child(node.first_child());
    }
    if (!text.empty()) {
        node.append_child(node_pcdata).set_value(text.c_str());
    }
}

string getTextXML(const xml_node& node)
{
    if (is_element(node, "w:t")) {
        return getLeafText(node);
    }
    string res;
    for (xml_node child: node.children()) {
        if (child.type()==node_element) {
            res += getTextXML(child);
        }
    }
    return res;
}

bool is_element(const xml_node& node, const char* name)
{
    return node.type()==node_element && strcmp(node.name(), name)==0;
}

xml_node find_child(const xml_node& node, const char* name)
{
    for (xml_node child: node.children()) {
        if (is_element(child, name)) {
            return child;
        }
    }
    return xml_node();
}

xml_node find_ancestor(const xml_node& node, const char* name)
{
    xml_node res = node.parent();
    while (res && !is_element(res, name)) {
        res = res.parent();
    }
    return res;
}

bool has_ancestor(const xml_node& node, const set<string>& names, const xml_node& stop)
{
    for (xml_node p = node.parent(); p && p!=stop; p = p.parent()) {
        if (p.type()==node_element && names.count(p.name())) {
            return true;
        }
    }
    return false;
}

void find_all(const xml_node& node, const char* name, xml_nodes& res)
{
    for (xml_node child: node.children()) {
        if (child.type()!=node_element) {
            continue;
        }
        if (strcmp(child.name(), name)==0) {
            res.push_back(child);
        }
        find_all(child, name, res);
    }
}

xml_nodes find_all(const xml_node& node, const char* name)
{
    xml_nodes res;
    find_all(node, name, res);
    return res;
}

xml_nodes child_elements(const xml_node& node)
{
    xml_nodes res;
    for (xml_node child: node.children()) {
        if (child.type()==node_element) {
            res.push_back(child);
        }
    }
    return res;
}

string canonical_xml(const xml_node& node)
{
    vector<string> attrs;
    for (xml_attribute attr: node.attributes()) {
        attrs.push_back(string(attr.name())+"="+attr.value());
    }
    sort(attrs.begin(), attrs.end());
    string res = node.name();
    for (const string& a: attrs) {
        res+="|"+a;
    }
    string text = getLeafText(node);
    if (!text.empty()) {
        res+="|"+text;
    }
    for (xml_node child: node.children()) {
        if (child.type()==node_element) {
            res+="|("+canonical_xml(child)+")";
        }
    }
    return res;
}

string serialize_node(const xml_node& node)
{
    ostringstream os;
    node.print(os, "", format_raw|format_no_declaration);
    return os.str();
}

void remove_all(xml_node root, const char* name)
{
    xml_node child = root.first_child();
    while (child) {
        xml_node next = child.next_sibling();
        if (is_element(child, name)) {
            root.remove_child(child);
        } else {
            remove_all(child, name);
        }
        child = next;
    }
}

void unwrap(xml_node node)
{
    xml_node parent = node.parent();
    if (!parent) {
        return;
    }
    while (xml_node child = node.first_child()) {
        parent.insert_move_before(child, node);
    }
    parent.remove_child(node);
}

void unwrap_all(xml_node root, const char* name)
{
    xml_nodes found = find_all(root, name);
    // Innermost first so every handle stays attached while we work
    for (auto it = found.rbegin(); it!=found.rend(); ++it) {
        unwrap(*it);
    }
}

void rename_all(xml_node root, const char* from, const char* to)
{
    for (xml_node& n: find_all(root, from)) {
        n.set_name(to);
    }
}

xml_node wrap_node(xml_node node, const char* wrapper_name)
{
    xml_node wrapper = node.parent().insert_child_before(wrapper_name, node);
    wrapper.append_move(node);
    return wrapper;
}

void set_revision_attrs(xml_node node, int id, const string& author, const string& date)
{
    node.append_attribute("w:id") = id;
    node.append_attribute("w:author") = author.c_str();
    node.append_attribute("w:date") = date.c_str();
}

bool needs_space_preserve(const string& text)
{
    if (text.empty()) {
        return false;
    }
    return text[0]==' ' || text[text.size()-1]==' ' || text.find("  ")!=string::npos;
}

xml_node append_text_element(xml_node parent, const char* name, const string& text)
{
    xml_node t = parent.append_child(name);
    if (needs_space_preserve(text)) {
        t.append_attribute("xml:space") = "preserve";
    }
    setLeafText(t, text);
    return t;
}

} // namespace redline
