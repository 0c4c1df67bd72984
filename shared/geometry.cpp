// geometry.cpp - Path resolution, bounding boxes and cubic flattening

#include "geometry.h"
#include "variant_utils.h"

#include <algorithm>
#include <limits>

namespace tessera {

BezPath& BezPath::moveTo(Point p) {
    elements_.push_back({PathVerb::MoveTo, {p, Point(), Point()}});
    return *this;
}

BezPath& BezPath::lineTo(Point p) {
    elements_.push_back({PathVerb::LineTo, {p, Point(), Point()}});
    return *this;
}

BezPath& BezPath::quadTo(Point c, Point p) {
    elements_.push_back({PathVerb::QuadTo, {c, p, Point()}});
    return *this;
}

BezPath& BezPath::curveTo(Point c1, Point c2, Point p) {
    elements_.push_back({PathVerb::CurveTo, {c1, c2, p}});
    return *this;
}

BezPath& BezPath::closePath() {
    elements_.push_back({PathVerb::ClosePath, {}});
    return *this;
}

std::vector<PathSegment> BezPath::segments() const {
    std::vector<PathSegment> result;
    Point start;
    Point current;
    bool subpathPending = true;

    for (const auto& el : elements_) {
        PathSegment seg;
        switch (el.verb) {
            case PathVerb::MoveTo:
                start = el.points[0];
                current = start;
                subpathPending = true;
                continue;
            case PathVerb::LineTo:
                seg.kind = PathSegment::Kind::Line;
                seg.points = {current, el.points[0], Point(), Point()};
                current = el.points[0];
                break;
            case PathVerb::QuadTo:
                seg.kind = PathSegment::Kind::Quad;
                seg.points = {current, el.points[0], el.points[1], Point()};
                current = el.points[1];
                break;
            case PathVerb::CurveTo:
                seg.kind = PathSegment::Kind::Cubic;
                seg.points = {current, el.points[0], el.points[1], el.points[2]};
                current = el.points[2];
                break;
            case PathVerb::ClosePath:
                if (current == start) {
                    subpathPending = true;
                    continue;
                }
                seg.kind = PathSegment::Kind::Line;
                seg.points = {current, start, Point(), Point()};
                current = start;
                break;
        }
        seg.startsSubpath = subpathPending;
        subpathPending = (el.verb == PathVerb::ClosePath);
        result.push_back(seg);
    }
    return result;
}

Rect BezPath::boundingBox() const {
    if (elements_.empty()) {
        return Rect();
    }

    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();

    // Control-point hull: never smaller than the true curve bounds
    auto include = [&](const Point& p) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    };

    for (const auto& el : elements_) {
        switch (el.verb) {
            case PathVerb::MoveTo:
            case PathVerb::LineTo:
                include(el.points[0]);
                break;
            case PathVerb::QuadTo:
                include(el.points[0]);
                include(el.points[1]);
                break;
            case PathVerb::CurveTo:
                include(el.points[0]);
                include(el.points[1]);
                include(el.points[2]);
                break;
            case PathVerb::ClosePath:
                break;
        }
    }
    return Rect(minX, minY, maxX, maxY);
}

Rect boundingBox(const Shape& shape) {
    return std::visit(Overloaded{
        [](const Rect& r) { return Rect::fromPoints(r.origin(), Point(r.x1, r.y1)); },
        [](const RoundedRect& rr) { return Rect::fromPoints(rr.rect.origin(), Point(rr.rect.x1, rr.rect.y1)); },
        [](const Line& l) { return Rect::fromPoints(l.p0, l.p1); },
        [](const Circle& c) {
            return Rect(c.center.x - c.radius, c.center.y - c.radius,
                        c.center.x + c.radius, c.center.y + c.radius);
        },
        [](const BezPath& p) { return p.boundingBox(); },
    }, shape);
}

Affine Affine::operator*(const Affine& other) const {
    const auto& a = coeffs_;
    const auto& b = other.coeffs_;
    return Affine(
        a[0] * b[0] + a[2] * b[1],
        a[1] * b[0] + a[3] * b[1],
        a[0] * b[2] + a[2] * b[3],
        a[1] * b[2] + a[3] * b[3],
        a[0] * b[4] + a[2] * b[5] + a[4],
        a[1] * b[4] + a[3] * b[5] + a[5]);
}

namespace {

Point lerp(Point a, Point b, double t) {
    return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

Point evalCubic(const PathSegment& c, double t) {
    Point ab = lerp(c.points[0], c.points[1], t);
    Point bc = lerp(c.points[1], c.points[2], t);
    Point cd = lerp(c.points[2], c.points[3], t);
    return lerp(lerp(ab, bc, t), lerp(bc, cd, t), t);
}

// Control points of the cubic restricted to [t0, t1]
PathSegment subdivide(const PathSegment& c, double t0, double t1) {
    Point p0 = evalCubic(c, t0);
    Point p3 = evalCubic(c, t1);

    // Derivative of the cubic, scaled to the sub-interval
    auto deriv = [&](double t) {
        double mt = 1.0 - t;
        Point d = (c.points[1] - c.points[0]) * (3.0 * mt * mt) +
                  (c.points[2] - c.points[1]) * (6.0 * mt * t) +
                  (c.points[3] - c.points[2]) * (3.0 * t * t);
        return d;
    };
    double scale = (t1 - t0) / 3.0;
    Point p1 = p0 + deriv(t0) * scale;
    Point p2 = p3 - deriv(t1) * scale;

    PathSegment out;
    out.kind = PathSegment::Kind::Cubic;
    out.points = {p0, p1, p2, p3};
    return out;
}

}  // namespace

void cubicToQuads(const PathSegment& cubic, double accuracy, std::vector<std::array<Point, 2>>& out) {
    const auto& p = cubic.points;

    // Error bound of the midpoint quad approximation (third-derivative term)
    Point p1x2 = p[1] * 3.0 - p[0];
    Point p2x2 = p[2] * 3.0 - p[3];
    Point diff = p2x2 - p1x2;
    double err = diff.x * diff.x + diff.y * diff.y;
    double maxHypot2 = 432.0 * accuracy * accuracy;
    int n = static_cast<int>(std::ceil(std::pow(err / maxHypot2, 1.0 / 6.0)));
    n = std::max(n, 1);

    for (int i = 0; i < n; ++i) {
        double t0 = static_cast<double>(i) / n;
        double t1 = static_cast<double>(i + 1) / n;
        PathSegment sub = subdivide(cubic, t0, t1);
        const auto& s = sub.points;
        Point control = ((s[1] + s[2]) * 3.0 - s[0] - s[3]) * 0.25;
        out.push_back({control, s[3]});
    }
}

}  // namespace tessera
