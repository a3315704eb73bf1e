#include "claimtrax/territory.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "claimtrax/area.hpp"
#include "claimtrax/utils/utils.hpp"

namespace claimtrax {

    namespace {

        using BPoint = boost::geometry::model::d2::point_xy<double>;
        using BPolygon = boost::geometry::model::polygon<BPoint>;

        std::string lowercase(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            return s;
        }

    } // namespace

    std::string generate_territory_id() { return boost::uuids::to_string(boost::uuids::random_generator()()); }

    bool same_owner(const std::string &a, const std::string &b) { return lowercase(a) == lowercase(b); }

    Territory make_territory(const std::string &owner_id, const Path &polygon, Timestamp created_at, std::string id) {
        if (id.empty())
            id = generate_territory_id();

        Territory territory;
        territory.id = std::move(id);
        territory.owner_id = owner_id;
        territory.polygon = polygon;
        territory.area_sqm = spherical_area(polygon);
        territory.bounding_box = utils::bounding_box(polygon);
        territory.created_at = created_at;
        territory.active = true;
        return territory;
    }

    TerritoryRecord make_record(const std::string &owner_id, const Path &path, double area_sqm, Timestamp started_at,
                                Timestamp completed_at) {
        TerritoryRecord record;
        record.owner_id = owner_id;
        record.ordered_points = path;
        record.area_sqm = area_sqm;
        record.bounding_box = utils::bounding_box(path);
        record.point_count = path.size();
        record.started_at = started_at;
        record.completed_at = completed_at;
        return record;
    }

    std::string TerritoryRecord::to_wkt() const {
        if (ordered_points.size() < 3)
            return "POLYGON EMPTY";

        // WKT is longitude first
        BPolygon polygon;
        for (const auto &c : ordered_points) {
            boost::geometry::append(polygon.outer(), BPoint(c.longitude, c.latitude));
        }
        if (!boost::geometry::equals(polygon.outer().front(), polygon.outer().back()))
            polygon.outer().push_back(polygon.outer().front());

        std::ostringstream ss;
        ss << std::setprecision(12) << boost::geometry::wkt(polygon);
        return ss.str();
    }

    TerritoryRoster::TerritoryRoster(std::vector<Territory> territories) : territories_(std::move(territories)) {
        rebuild_index();
    }

    void TerritoryRoster::replace(std::vector<Territory> territories) {
        territories_ = std::move(territories);
        rebuild_index();
    }

    void TerritoryRoster::add(Territory territory) {
        territory.bounding_box = utils::bounding_box(territory.polygon);
        territories_.push_back(std::move(territory));
        index_.insert(territories_.back().bounding_box.to_aabb(), territories_.size() - 1);
    }

    bool TerritoryRoster::deactivate(const std::string &id) {
        for (auto &territory : territories_) {
            if (territory.id == id) {
                territory.active = false;
                return true;
            }
        }
        return false;
    }

    std::vector<const Territory *> TerritoryRoster::foreign(const std::string &owner_id) const {
        std::vector<const Territory *> result;
        for (const auto &territory : territories_) {
            if (territory.active && !same_owner(territory.owner_id, owner_id))
                result.push_back(&territory);
        }
        return result;
    }

    std::vector<const Territory *> TerritoryRoster::foreign_near(const std::string &owner_id,
                                                                 const BoundingBox &box) const {
        std::vector<const Territory *> result;
        auto candidates = index_.query_intersects(box.to_aabb());
        for (const auto &candidate : candidates) {
            std::size_t idx = candidate.data;
            if (idx >= territories_.size())
                continue;
            const Territory &territory = territories_[idx];
            if (territory.active && !same_owner(territory.owner_id, owner_id))
                result.push_back(&territory);
        }
        return result;
    }

    void TerritoryRoster::rebuild_index() {
        index_.clear();
        for (std::size_t i = 0; i < territories_.size(); ++i) {
            // The index must agree with the polygon even if the collaborator sent a stale box
            territories_[i].bounding_box = utils::bounding_box(territories_[i].polygon);
            index_.insert(territories_[i].bounding_box.to_aabb(), i);
        }
    }

} // namespace claimtrax
