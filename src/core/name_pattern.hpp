#pragma once

#include <string>

// Run-name grammar: starts with a letter, then alphanumerics where every
// '-' or '_' is immediately followed by an alphanumeric. Case-insensitive,
// at most 80 characters.
bool matches_run_name_grammar(const std::string& name);

// Cluster resource-name grammar: lowercase alphanumeric segments separated by
// single '-' or '.', each segment starting and ending with an alphanumeric.
bool matches_cluster_resource_grammar(const std::string& name);

// Map every '_' to '-' so the name is usable as a cluster resource name.
std::string normalize_run_name(const std::string& name);

// Descriptions used in error messages
const char* run_name_grammar_description();
const char* cluster_resource_grammar_description();
