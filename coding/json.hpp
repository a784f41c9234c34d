#pragma once

#include "geometry/point2d.hpp"

#include "base/exception.hpp"
#include "base/macros.hpp"

#define RAPIDJSON_HAS_STDSTRING 1
#define RAPIDJSON_HAS_CXX11_TYPETRAITS 1

#include <rapidjson/document.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace coding
{
DECLARE_EXCEPTION(JsonException, RootException);

using JsonValue = rapidjson::Value;
using JsonDocument = rapidjson::Document;

inline void FromJson(JsonValue const & root, double & result)
{
  if (!root.IsNumber())
    MYTHROW(coding::JsonException, ("Object must contain a json number."));
  result = root.GetDouble();
}

inline void FromJson(JsonValue const & root, std::string & result)
{
  if (!root.IsString())
    MYTHROW(coding::JsonException, ("The field must contain a json string."));
  result = root.GetString();
}

// GeoJSON positions are [lon, lat].
inline void FromJson(JsonValue const & root, m2::PointD & result)
{
  if (!root.IsArray() || root.Size() != 2)
    MYTHROW(coding::JsonException, ("Position must be an array of two numbers."));
  FromJson(root[0u], result.x);
  FromJson(root[1u], result.y);
}

template <typename T>
void FromJson(JsonValue const & root, std::vector<T> & result)
{
  if (!root.IsArray())
    MYTHROW(coding::JsonException, ("The field must contain a json array."));
  result.resize(root.Size());
  for (rapidjson::SizeType i = 0; i < root.Size(); ++i)
    FromJson(root[i], result[i]);
}

inline JsonDocument ParseJson(std::string const & str)
{
  JsonDocument document;
  document.Parse(str.c_str());
  if (document.HasParseError())
  {
    MYTHROW(coding::JsonException, ("Cannot parse json, error", document.GetParseError(), "at",
                                    document.GetErrorOffset()));
  }
  return document;
}

static const coding::JsonValue nullValue;

inline coding::JsonValue const & GetJsonOptionalField(coding::JsonValue const & root,
                                                      std::string const & field)
{
  if (!root.IsObject())
    MYTHROW(coding::JsonException, ("Bad json object while parsing", field));

  coding::JsonValue::ConstMemberIterator it = root.FindMember(field);

  if (it == root.MemberEnd())
    return nullValue;

  return it->value;
}

inline coding::JsonValue const & GetJsonObligatoryField(coding::JsonValue const & root,
                                                        std::string const & field)
{
  coding::JsonValue const & value = GetJsonOptionalField(root, field);
  if (value.IsNull())
    MYTHROW(coding::JsonException, ("Obligatory field", field, "is absent."));

  return value;
}

template <class First>
inline coding::JsonValue const & GetJsonObligatoryFieldByPath(coding::JsonValue const & root,
                                                              First && path)
{
  return GetJsonObligatoryField(root, std::forward<First>(path));
}

template <class First, class... Paths>
inline coding::JsonValue const & GetJsonObligatoryFieldByPath(coding::JsonValue const & root,
                                                              First && path, Paths &&... paths)
{
  coding::JsonValue const & newRoot = GetJsonObligatoryFieldByPath(root, std::forward<First>(path));
  return GetJsonObligatoryFieldByPath(newRoot, std::forward<Paths>(paths)...);
}

template <typename T>
T GetJsonObligatoryFieldAs(coding::JsonValue const & root, std::string const & field)
{
  T result{};
  FromJson(GetJsonObligatoryField(root, field), result);
  return result;
}

template <typename Stream>
class JsonCustomPrecisionWriter : public rapidjson::Writer<Stream>
{
public:
  // Digits after the decimal point. With 9 digits a degree value keeps about 0.1 mm, which is
  // below the size of a 12-symbol geohash cell.
  static uint32_t constexpr kDefaultPrecision = 9;

  explicit JsonCustomPrecisionWriter(Stream & stream, size_t precision = kDefaultPrecision)
    : rapidjson::Writer<Stream>(stream), m_precision(precision)
  {
  }

  bool Double(double d)
  {
    this->Prefix(rapidjson::kNumberType);
    std::stringstream ss;
    ss << std::fixed << std::setprecision(m_precision) << d;
    std::string number = ss.str();

    for (char c : number)
      this->os_->Put(c);

    return true;
  }

  bool Point(m2::PointD const & p)
  {
    return this->StartArray() && Double(p.x) && Double(p.y) && this->EndArray();
  }

private:
  size_t m_precision = kDefaultPrecision;
};

using JsonStringWriter = JsonCustomPrecisionWriter<rapidjson::StringBuffer>;
}  // namespace coding
