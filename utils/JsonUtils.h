#pragma once
#include "../math/Vec3.h"
#include <string>

// Minimal key lookup for flat JSON objects. Each function finds the first
// occurrence of "key" and parses the value after its colon; on any mismatch
// it returns false and leaves out untouched.
namespace JsonUtils {
    bool findBool(const std::string& json, const char* key, bool& out);
    bool findString(const std::string& json, const char* key, std::string& out);
    bool findNumber(const std::string& json, const char* key, float& out);
    bool findInt(const std::string& json, const char* key, int& out);
    bool findVec3(const std::string& json, const char* key, Vec3& out);
    bool hasKey(const std::string& json, const char* key);
}
