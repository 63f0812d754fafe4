/**
 * @file ContainerBounds.hpp
 * Maximum display area the rendered paper must fit inside.
 */
#pragma once

struct ContainerBounds
{
    int width {600};
    int height {500};

    ContainerBounds() = default;
    ContainerBounds(int w, int h) : width(w), height(h) {}
};
