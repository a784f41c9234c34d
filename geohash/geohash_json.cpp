#include "geohash/geohash_json.hpp"

#include "geohash/geohash.hpp"

#include "coding/json.hpp"

#include "base/assert.hpp"

namespace geohash
{
namespace
{
void WriteGeometry(coding::JsonStringWriter & writer, DecodedCell const & cell)
{
  writer.StartObject();
  writer.Key("type");
  writer.String("Polygon");
  writer.Key("coordinates");
  writer.StartArray();
  writer.StartArray();
  for (auto const & point : cell.GetRing())
    writer.Point(point);
  writer.EndArray();
  writer.EndArray();
  writer.EndObject();
}

void WriteProperties(coding::JsonStringWriter & writer, std::string const & geohash,
                     DecodedCell const & cell)
{
  writer.StartObject();
  writer.Key("geohash");
  writer.String(geohash);
  writer.Key("center");
  writer.Point(cell.GetPoint());
  writer.Key("error");
  writer.Point({cell.GetLonErr(), cell.GetLatErr()});
  writer.EndObject();
}
}  // namespace

std::string ToGeoJson(std::string const & geohash, DecodedCell const & cell, size_t digits)
{
  rapidjson::StringBuffer buffer;
  coding::JsonStringWriter writer(buffer, digits);

  writer.StartObject();
  writer.Key("type");
  writer.String("Feature");
  writer.Key("geometry");
  WriteGeometry(writer, cell);
  writer.Key("properties");
  WriteProperties(writer, geohash, cell);
  writer.EndObject();

  CHECK(writer.IsComplete(), (geohash));
  return buffer.GetString();
}

std::string ToGeoJson(std::string const & geohash, size_t digits)
{
  return ToGeoJson(geohash, Decode(geohash), digits);
}
}  // namespace geohash
