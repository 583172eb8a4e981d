/**
 * @file Geometry.hpp
 * @brief Plain geometric value types stored as container leaves
 *
 * Each type encodes itself as a small JSON object (its own field layout),
 * through nlohmann::json's to_json/from_json customization points:
 * - Vector2    {"x","y"}
 * - Vector3    {"x","y","z"}
 * - Vector4    {"x","y","z","w"}
 * - Quaternion {"x","y","z","w"}
 * - Color      {"r","g","b","a"}
 * - Rect       {"x","y","width","height"}
 * - Bounds     {"centerX","centerY","centerZ","sizeX","sizeY","sizeZ"}
 *
 * from_json throws nlohmann::json::exception when a field is missing or
 * not a number.
 */

#ifndef STRATUM_GEOMETRY_HPP
#define STRATUM_GEOMETRY_HPP

#include <nlohmann/json.hpp>

namespace stratum {

struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;
};

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct Vector4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;
};

struct Quaternion {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 1.0f;
};

struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

/// Axis-aligned box given by its center and full size
struct Bounds {
    Vector3 center;
    Vector3 size;
};

bool operator==(const Vector2& a, const Vector2& b);
bool operator==(const Vector3& a, const Vector3& b);
bool operator==(const Vector4& a, const Vector4& b);
bool operator==(const Quaternion& a, const Quaternion& b);
bool operator==(const Color& a, const Color& b);
bool operator==(const Rect& a, const Rect& b);
bool operator==(const Bounds& a, const Bounds& b);

inline bool operator!=(const Vector2& a, const Vector2& b) { return !(a == b); }
inline bool operator!=(const Vector3& a, const Vector3& b) { return !(a == b); }
inline bool operator!=(const Vector4& a, const Vector4& b) { return !(a == b); }
inline bool operator!=(const Quaternion& a, const Quaternion& b) { return !(a == b); }
inline bool operator!=(const Color& a, const Color& b) { return !(a == b); }
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }
inline bool operator!=(const Bounds& a, const Bounds& b) { return !(a == b); }

void to_json(nlohmann::json& j, const Vector2& v);
void from_json(const nlohmann::json& j, Vector2& v);
void to_json(nlohmann::json& j, const Vector3& v);
void from_json(const nlohmann::json& j, Vector3& v);
void to_json(nlohmann::json& j, const Vector4& v);
void from_json(const nlohmann::json& j, Vector4& v);
void to_json(nlohmann::json& j, const Quaternion& q);
void from_json(const nlohmann::json& j, Quaternion& q);
void to_json(nlohmann::json& j, const Color& c);
void from_json(const nlohmann::json& j, Color& c);
void to_json(nlohmann::json& j, const Rect& r);
void from_json(const nlohmann::json& j, Rect& r);
void to_json(nlohmann::json& j, const Bounds& b);
void from_json(const nlohmann::json& j, Bounds& b);

} // namespace stratum

#endif // STRATUM_GEOMETRY_HPP
