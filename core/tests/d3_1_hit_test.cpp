// D3.1: HitTester proximity per variant, ordering and zoom invariance

#include "xa/hit/HitTester.hpp"
#include "xa/view/ViewTransform.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static xa::Annotation make(xa::Id id, xa::AnnotationType t, std::vector<xa::Point> pts) {
  xa::Annotation a;
  a.id = id;
  a.type = t;
  a.points = std::move(pts);
  return a;
}

int main() {
  using T = xa::AnnotationType;
  xa::HitTester ht;
  const double th = 15.0;

  // ---- Test 1: box interior and edge band ----
  {
    auto box = make(1, T::Box, {{100, 100}, {200, 160}});
    requireTrue(ht.isNear({150, 130}, box, th), "interior");
    requireTrue(ht.isNear({90, 130}, box, th), "10 left of left edge");
    requireTrue(ht.isNear({150, 172}, box, th), "12 below bottom edge");
    requireTrue(!ht.isNear({80, 130}, box, th), "20 left is outside");
    requireTrue(!ht.isNear({150, 180}, box, th), "20 below is outside");
    requireTrue(ht.isNear({90, 90}, box, th), "corner band");
    requireTrue(!ht.isNear({90, 80}, box, th), "beyond corner band");
    std::printf("  Test 1 (box): PASS\n");
  }

  // ---- Test 2: circle, ellipse ----
  {
    auto circle = make(2, T::Circle, {{0, 0}, {100, 100}});  // c(50,50) r50
    requireTrue(ht.isNear({50, 50}, circle, th), "circle centre");
    requireTrue(ht.isNear({110, 50}, circle, th), "circle ring +10");
    requireTrue(!ht.isNear({120, 50}, circle, th), "circle +20 outside");

    auto ellipse = make(3, T::Ellipse, {{0, 0}, {200, 100}});  // c(100,50) rx100 ry50
    requireTrue(ht.isNear({100, 50}, ellipse, th), "ellipse centre");
    requireTrue(ht.isNear({205, 50}, ellipse, th), "ellipse right edge +5");
    requireTrue(!ht.isNear({100, 70 + 50}, ellipse, th), "ellipse 20 below bottom");

    auto flat = make(4, T::Ellipse, {{0, 0}, {100, 0}});
    requireTrue(!ht.isNear({50, 0}, flat, th), "zero-radius ellipse never hits");
    std::printf("  Test 2 (circle/ellipse): PASS\n");
  }

  // ---- Test 3: segments, marker, freehand, text ----
  {
    auto line = make(5, T::Line, {{0, 0}, {100, 0}});
    requireTrue(ht.isNear({50, 10}, line, th), "near segment");
    requireTrue(!ht.isNear({50, 20}, line, th), "far from segment");
    requireTrue(!ht.isNear({-20, 0}, line, th), "beyond endpoint");

    auto degenerate = make(6, T::Ruler, {{5, 5}, {5, 5}});
    requireTrue(!ht.isNear({5, 5}, degenerate, th), "zero-length segment never hits");

    auto angle = make(7, T::Angle, {{100, 0}, {0, 0}, {0, 100}});
    requireTrue(ht.isNear({5, 50}, angle, th), "second ray");
    requireTrue(!ht.isNear({50, 50}, angle, th), "inside the angle but off both rays");

    auto marker = make(8, T::Marker, {{0, 0}});
    requireTrue(ht.isNear({29, 0}, marker, th), "marker uses threshold + 15");
    requireTrue(!ht.isNear({31, 0}, marker, th), "marker outside");

    auto fh = make(9, T::Freehand, {{0, 0}, {50, 0}});
    requireTrue(ht.isNear({50, 10}, fh, th), "near a vertex");
    requireTrue(!ht.isNear({25, 0}, fh, th), "between vertices only vertices count");

    auto text = make(10, T::Text, {{0, 0}, {100, 30}});
    requireTrue(ht.isNear({50, 40}, text, th), "text expanded rect");
    requireTrue(!ht.isNear({50, 50}, text, th), "text outside");
    std::printf("  Test 3 (other variants): PASS\n");
  }

  // ---- Test 4: first hit in collection order, locked skipping ----
  {
    xa::AnnotationList list{
      make(1, T::Box, {{0, 0}, {100, 100}}),
      make(2, T::Box, {{10, 10}, {90, 90}}),
    };
    const xa::Annotation* hit = ht.findFirstHit(list, {50, 50}, th);
    requireTrue(hit && hit->id == 1, "earliest wins");

    list[0].locked = true;
    hit = ht.findFirstHit(list, {50, 50}, th);
    requireTrue(hit && hit->id == 1, "locked still selectable");
    hit = ht.findFirstHit(list, {50, 50}, th, true);
    requireTrue(hit && hit->id == 2, "skipLocked falls through");

    requireTrue(ht.findFirstHit(list, {500, 500}, th) == nullptr, "miss");
    std::printf("  Test 4 (ordering): PASS\n");
  }

  // ---- Test 5: hit decisions invariant under zoom ----
  // Each case names a point on the shape's outline and the outward direction
  // along which its proximity band is measured. Markers are left out: their
  // radius is in image units, so marker hits scale with zoom.
  {
    struct Case { xa::Annotation shape; xa::Point onEdge; xa::Point outward; };
    const Case cases[] = {
      {make(1, T::Box, {{100, 100}, {500, 400}}),              {300, 100}, {0, -1}},
      {make(2, T::Circle, {{100, 100}, {500, 500}}),           {500, 300}, {1, 0}},
      {make(3, T::Ellipse, {{100, 100}, {900, 500}}),          {500, 500}, {0, 1}},
      {make(4, T::Line, {{100, 100}, {500, 100}}),             {300, 100}, {0, 1}},
      {make(5, T::Ruler, {{100, 100}, {100, 500}}),            {100, 300}, {-1, 0}},
      {make(6, T::Angle, {{500, 100}, {100, 100}, {100, 500}}), {300, 100}, {0, -1}},
      {make(7, T::Freehand, {{0, 0}, {400, 0}, {800, 0}}),     {400, 0},   {0, 1}},
      {make(8, T::Text, {{100, 100}, {500, 200}}),             {300, 200}, {0, 1}},
    };
    const double zooms[] = {0.25, 0.5, 1.0, 2.0, 4.0, 8.0};
    for (const auto& c : cases) {
      for (double z : zooms) {
        xa::ViewTransform vt(z, {13, 29});
        xa::Point edge = vt.toScreen(c.onEdge);
        double thImage = vt.screenToImageDistance(15.0);

        xa::Point near = vt.toImage(edge + c.outward * 14.0);
        xa::Point far = vt.toImage(edge + c.outward * 16.0);
        requireTrue(ht.isNear(near, c.shape, thImage), "14 screen px hits at every zoom");
        requireTrue(!ht.isNear(far, c.shape, thImage), "16 screen px misses at every zoom");
      }
    }
    std::printf("  Test 5 (zoom invariance): PASS\n");
  }

  std::printf("D3.1 hit test: ALL PASS\n");
  return 0;
}
