/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE HitboxTests
#include <boost/test/unit_test.hpp>

#include "collisions/AABB.hpp"
#include "collisions/Hitbox.hpp"
#include "utils/Vector2D.hpp"

#include <limits>

using namespace KeeperEngine;

BOOST_AUTO_TEST_SUITE(AABBTests)

BOOST_AUTO_TEST_CASE(TestAABBBasicProperties)
{
    AABB aabb(10.0f, 20.0f, 5.0f, 7.5f);

    BOOST_CHECK_CLOSE(aabb.left(), 5.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.right(), 15.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.top(), 12.5f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.bottom(), 27.5f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.width(), 10.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.height(), 15.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestAABBFromCorner)
{
    AABB wall = AABB::fromCorner(100.0f, 0.0f, 40.0f, 200.0f);

    BOOST_CHECK_CLOSE(wall.center.getX(), 120.0f, 0.01f);
    BOOST_CHECK_CLOSE(wall.center.getY(), 100.0f, 0.01f);
    BOOST_CHECK_CLOSE(wall.left(), 100.0f, 0.01f);
    BOOST_CHECK_CLOSE(wall.bottom(), 200.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestAABBIntersection)
{
    AABB aabb1(10.0f, 10.0f, 5.0f, 5.0f);  // center at (10,10), size 10x10
    AABB aabb2(15.0f, 10.0f, 3.0f, 3.0f);  // center at (15,10), size 6x6
    AABB aabb3(20.0f, 10.0f, 2.0f, 2.0f);  // center at (20,10), size 4x4

    BOOST_CHECK(aabb1.intersects(aabb2));
    BOOST_CHECK(aabb2.intersects(aabb1));
    BOOST_CHECK(!aabb1.intersects(aabb3));
    BOOST_CHECK(!aabb3.intersects(aabb1));
}

BOOST_AUTO_TEST_CASE(TestTouchingEdgesDoNotIntersect)
{
    AABB left(0.0f, 0.0f, 5.0f, 5.0f);
    AABB right(10.0f, 0.0f, 5.0f, 5.0f);
    AABB below(0.0f, 10.0f, 5.0f, 5.0f);

    BOOST_CHECK(!left.intersects(right));
    BOOST_CHECK(!left.intersects(below));
}

BOOST_AUTO_TEST_CASE(TestAABBClosestPoint)
{
    AABB aabb(10.0f, 10.0f, 5.0f, 5.0f);

    Vector2D inside(10.0f, 10.0f);
    Vector2D closest1 = aabb.closestPoint(inside);
    BOOST_CHECK_CLOSE(closest1.getX(), inside.getX(), 0.01f);
    BOOST_CHECK_CLOSE(closest1.getY(), inside.getY(), 0.01f);

    Vector2D outside(20.0f, 20.0f);
    Vector2D closest2 = aabb.closestPoint(outside);
    BOOST_CHECK_CLOSE(closest2.getX(), 15.0f, 0.01f);
    BOOST_CHECK_CLOSE(closest2.getY(), 15.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestMinimumTranslationUsesShallowAxis)
{
    AABB wall = AABB::fromCorner(100.0f, 0.0f, 100.0f, 300.0f);

    // Overlaps the wall's left face by 4
    AABB ship(80.0f, 150.0f, 24.0f, 16.0f);
    Vector2D push = ship.minimumTranslation(wall);
    BOOST_CHECK_CLOSE(push.getX(), -4.0f, 0.01f);
    BOOST_CHECK_EQUAL(push.getY(), 0.0f);

    // Overlaps the wall's bottom face by 6
    AABB under(150.0f, 310.0f, 24.0f, 16.0f);
    Vector2D up = under.minimumTranslation(wall);
    BOOST_CHECK_EQUAL(up.getX(), 0.0f);
    BOOST_CHECK_CLOSE(up.getY(), 6.0f, 0.01f);

    AABB apart(0.0f, 0.0f, 5.0f, 5.0f);
    Vector2D none = apart.minimumTranslation(wall);
    BOOST_CHECK_EQUAL(none.getX(), 0.0f);
    BOOST_CHECK_EQUAL(none.getY(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(HitboxShapeTests)

BOOST_AUTO_TEST_CASE(TestValidity)
{
    BOOST_CHECK(Hitbox::circle(4.0f).isValid());
    BOOST_CHECK(Hitbox::box(48.0f, 32.0f).isValid());
    BOOST_CHECK(!Hitbox::circle(0.0f).isValid());
    BOOST_CHECK(!Hitbox::circle(-1.0f).isValid());
    BOOST_CHECK(!Hitbox::box(10.0f, 0.0f).isValid());
    BOOST_CHECK(!Hitbox::circle(std::numeric_limits<float>::infinity()).isValid());
}

BOOST_AUTO_TEST_CASE(TestBoundsAt)
{
    AABB circleBounds = Hitbox::circle(8.0f).boundsAt(Vector2D(50.0f, 60.0f));
    BOOST_CHECK_CLOSE(circleBounds.left(), 42.0f, 0.01f);
    BOOST_CHECK_CLOSE(circleBounds.bottom(), 68.0f, 0.01f);

    AABB boxBounds = Hitbox::box(48.0f, 32.0f).boundsAt(Vector2D(100.0f, 100.0f));
    BOOST_CHECK_CLOSE(boxBounds.left(), 76.0f, 0.01f);
    BOOST_CHECK_CLOSE(boxBounds.top(), 84.0f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(HitboxOverlapTests)

BOOST_AUTO_TEST_CASE(TestCircleCircle)
{
    Hitbox c = Hitbox::circle(10.0f);
    BOOST_CHECK(hitboxesOverlap(c, Vector2D(0.0f, 0.0f), c, Vector2D(15.0f, 0.0f)));
    BOOST_CHECK(!hitboxesOverlap(c, Vector2D(0.0f, 0.0f), c, Vector2D(20.0f, 0.0f))); // touching
    BOOST_CHECK(!hitboxesOverlap(c, Vector2D(0.0f, 0.0f), c, Vector2D(15.0f, 15.0f)));
}

BOOST_AUTO_TEST_CASE(TestBoxBox)
{
    Hitbox b = Hitbox::box(10.0f, 10.0f);
    BOOST_CHECK(hitboxesOverlap(b, Vector2D(0.0f, 0.0f), b, Vector2D(9.0f, 9.0f)));
    BOOST_CHECK(!hitboxesOverlap(b, Vector2D(0.0f, 0.0f), b, Vector2D(10.0f, 0.0f)));
}

BOOST_AUTO_TEST_CASE(TestCircleBox)
{
    Hitbox circle = Hitbox::circle(5.0f);
    Hitbox box = Hitbox::box(10.0f, 10.0f);

    BOOST_CHECK(hitboxesOverlap(circle, Vector2D(9.0f, 0.0f), box, Vector2D(0.0f, 0.0f)));
    BOOST_CHECK(!hitboxesOverlap(circle, Vector2D(10.0f, 0.0f), box, Vector2D(0.0f, 0.0f)));

    // Bounds overlap near the corner but the circle misses the box
    Hitbox small = Hitbox::circle(4.0f);
    BOOST_CHECK(small.boundsAt(Vector2D(8.0f, 8.0f)).intersects(box.boundsAt(Vector2D(0.0f, 0.0f))));
    BOOST_CHECK(!hitboxesOverlap(small, Vector2D(8.0f, 8.0f), box, Vector2D(0.0f, 0.0f)));
}

BOOST_AUTO_TEST_CASE(TestOverlapIsSymmetric)
{
    Hitbox circle = Hitbox::circle(5.0f);
    Hitbox box = Hitbox::box(10.0f, 10.0f);
    Vector2D circlePos(9.0f, 3.0f);
    Vector2D boxPos(0.0f, 0.0f);

    BOOST_CHECK_EQUAL(hitboxesOverlap(circle, circlePos, box, boxPos),
                      hitboxesOverlap(box, boxPos, circle, circlePos));
}

BOOST_AUTO_TEST_SUITE_END()
