// geometry.h - 2D geometry primitives for the Tessera renderer
// Points, rectangles, affine transforms and the Shape sum type handed to
// stroke(), fill() and clip().

#ifndef TESSERA_GEOMETRY_H
#define TESSERA_GEOMETRY_H

#include <array>
#include <cmath>
#include <variant>
#include <vector>

namespace tessera {

struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double px, double py) : x(px), y(py) {}

    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    Point operator*(double s) const { return {x * s, y * s}; }
    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Size {
    double width = 0.0;
    double height = 0.0;

    Size() = default;
    Size(double w, double h) : width(w), height(h) {}

    bool operator==(const Size& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Size& o) const { return !(*this == o); }
};

// Axis-aligned rectangle stored as two corners (x0,y0) - (x1,y1)
struct Rect {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    Rect() = default;
    Rect(double left, double top, double right, double bottom)
        : x0(left), y0(top), x1(right), y1(bottom) {}

    static Rect fromOriginSize(Point origin, Size size) {
        return {origin.x, origin.y, origin.x + size.width, origin.y + size.height};
    }

    // Normalized rectangle spanning two arbitrary points
    static Rect fromPoints(Point a, Point b) {
        return {std::fmin(a.x, b.x), std::fmin(a.y, b.y), std::fmax(a.x, b.x), std::fmax(a.y, b.y)};
    }

    Point origin() const { return {x0, y0}; }
    double width() const { return x1 - x0; }
    double height() const { return y1 - y0; }
    Size size() const { return {width(), height()}; }
    Point center() const { return {(x0 + x1) * 0.5, (y0 + y1) * 0.5}; }

    bool operator==(const Rect& o) const {
        return x0 == o.x0 && y0 == o.y0 && x1 == o.x1 && y1 == o.y1;
    }
};

struct RoundedRectRadii {
    double topLeft = 0.0;
    double topRight = 0.0;
    double bottomRight = 0.0;
    double bottomLeft = 0.0;

    RoundedRectRadii() = default;
    explicit RoundedRectRadii(double all) : topLeft(all), topRight(all), bottomRight(all), bottomLeft(all) {}
};

struct RoundedRect {
    Rect rect;
    RoundedRectRadii radii;

    RoundedRect() = default;
    RoundedRect(Rect r, double radius) : rect(r), radii(radius) {}
    RoundedRect(Rect r, RoundedRectRadii rr) : rect(r), radii(rr) {}
};

struct Line {
    Point p0;
    Point p1;
};

struct Circle {
    Point center;
    double radius = 0.0;
};

// Path construction verbs, mirroring the SVG path model
enum class PathVerb {
    MoveTo,
    LineTo,
    QuadTo,
    CurveTo,
    ClosePath
};

struct PathElement {
    PathVerb verb = PathVerb::MoveTo;
    std::array<Point, 3> points{};
};

// One drawable piece of a path after resolving MoveTo/ClosePath
struct PathSegment {
    enum class Kind { Line, Quad, Cubic };

    Kind kind = Kind::Line;
    std::array<Point, 4> points{};  // p0..p1 (line), p0..p2 (quad), p0..p3 (cubic)
    bool startsSubpath = false;     // first segment after a MoveTo or ClosePath
};

class BezPath {
public:
    BezPath() = default;

    BezPath& moveTo(Point p);
    BezPath& lineTo(Point p);
    BezPath& quadTo(Point c, Point p);
    BezPath& curveTo(Point c1, Point c2, Point p);
    BezPath& closePath();

    const std::vector<PathElement>& elements() const { return elements_; }
    bool empty() const { return elements_.empty(); }

    /**
     * Resolve the element list into explicit segments.
     * ClosePath emits a closing line when the current point is away from
     * the subpath start. Drawing after a ClosePath starts a new subpath at
     * the old start point.
     */
    std::vector<PathSegment> segments() const;

    Rect boundingBox() const;

private:
    std::vector<PathElement> elements_;
};

/**
 * Closed set of shapes understood by the renderer.
 * stroke/fill/clip dispatch on the alternative in a fixed priority order.
 */
using Shape = std::variant<Rect, RoundedRect, Line, Circle, BezPath>;

Rect boundingBox(const Shape& shape);

/**
 * 2D affine transform with coefficients [a b c d e f]:
 *   x' = a*x + c*y + e
 *   y' = b*x + d*y + f
 */
class Affine {
public:
    Affine() = default;
    Affine(double a, double b, double c, double d, double e, double f) : coeffs_{a, b, c, d, e, f} {}

    static Affine identity() { return {}; }
    static Affine translate(double tx, double ty) { return {1.0, 0.0, 0.0, 1.0, tx, ty}; }
    static Affine scale(double s) { return {s, 0.0, 0.0, s, 0.0, 0.0}; }
    static Affine scale(double sx, double sy) { return {sx, 0.0, 0.0, sy, 0.0, 0.0}; }

    const std::array<double, 6>& coeffs() const { return coeffs_; }

    Point apply(Point p) const {
        return {coeffs_[0] * p.x + coeffs_[2] * p.y + coeffs_[4],
                coeffs_[1] * p.x + coeffs_[3] * p.y + coeffs_[5]};
    }

    // this * other: other is applied first
    Affine operator*(const Affine& other) const;

    bool isIdentity() const { return coeffs_ == identity().coeffs_; }

private:
    std::array<double, 6> coeffs_{1.0, 0.0, 0.0, 1.0, 0.0, 0.0};
};

/**
 * Approximate a cubic Bezier with quadratic Beziers within the given accuracy.
 * Appends (control, end) pairs for each quad; the start point is implied.
 */
void cubicToQuads(const PathSegment& cubic, double accuracy, std::vector<std::array<Point, 2>>& out);

}  // namespace tessera

#endif  // TESSERA_GEOMETRY_H
