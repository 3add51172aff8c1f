#ifndef REDLINE_XML_UTILS_H
#define REDLINE_XML_UTILS_H

#include <vector>
#include <set>
#include <string>
#include <iostream>
#include "pugixml.hpp"

namespace redline {

typedef std::vector<pugi::xml_node> xml_nodes;
typedef std::set<pugi::xml_node> xml_node_set;

// Flags used for every document we parse; whitespace-only w:t must survive.
const unsigned int PARSE_OPTIONS = pugi::parse_default | pugi::parse_ws_pcdata_single;

void loadXML(pugi::xml_document& doc, const std::string& filename);
void loadXMLString(pugi::xml_document& doc, const std::string& xml);
std::string saveXML(const pugi::xml_node& doc);

// w:body of a document or throws Input/BodyNotFound
pugi::xml_node find_body(const pugi::xml_node& root);

std::string getLeafText(const pugi::xml_node& node);
void setLeafText(pugi::xml_node node, const std::string& text);

// Text of all w:t descendants in document order
std::string getTextXML(const pugi::xml_node& node);

bool is_element(const pugi::xml_node& node, const char* name);
pugi::xml_node find_child(const pugi::xml_node& node, const char* name);
pugi::xml_node find_ancestor(const pugi::xml_node& node, const char* name);
bool has_ancestor(const pugi::xml_node& node, const std::set<std::string>& names, const pugi::xml_node& stop = pugi::xml_node());

void find_all(const pugi::xml_node& node, const char* name, xml_nodes& res);
xml_nodes find_all(const pugi::xml_node& node, const char* name);
xml_nodes child_elements(const pugi::xml_node& node);

// tag|k=v...|text|children, attributes sorted, recursively. Equal strings mean equal subtrees.
std::string canonical_xml(const pugi::xml_node& node);
std::string serialize_node(const pugi::xml_node& node);

void remove_all(pugi::xml_node root, const char* name);
void unwrap(pugi::xml_node node);
void unwrap_all(pugi::xml_node root, const char* name);
void rename_all(pugi::xml_node root, const char* from, const char* to);

// Moves node into a new element named wrapper_name placed at node's position
pugi::xml_node wrap_node(pugi::xml_node node, const char* wrapper_name);

void set_revision_attrs(pugi::xml_node node, int id, const std::string& author, const std::string& date);

// w:t child with xml:space="preserve" when the text needs it
pugi::xml_node append_text_element(pugi::xml_node parent, const char* name, const std::string& text);

bool needs_space_preserve(const std::string& text);

} // namespace redline

#endif // REDLINE_XML_UTILS_H
