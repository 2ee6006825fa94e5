#pragma once

#include <raylib.h>
#include <raymath.h>
#include <rlgl.h>
#include <vector>
#include <functional>
#include "polyloop.h"

#define RENDER_MOVE_SPEED 0.03f
#define RENDER_ROTATE_SPEED 0.003f
#define RENDER_ZOOM_SPEED 1.0f

namespace render
{
    using Scalar = polyloop::Scalar;
    using Vec3 = polyloop::Vector3;
    using polyloop::Polyloop3;

    struct FrameCallbacks
    {
        std::function<void()> onUpdate;
        std::function<void()> onDraw3D;
        std::function<void()> onDraw2D;
    };

    class Renderer3D
    {
    private:
        const char *name_;
        int width_, height_;
        float fovy_;
        CameraProjection projection_;
        Camera camera_;
        float yaw_, pitch_, distance_;

    public:
        Renderer3D(int width, int height, float fovy, CameraProjection proj, const char *name);
        ~Renderer3D();

        // orbit around target (mesh coordinates, z up)
        void lookAt(const Vec3 &target, float distance);
        void updateCamera();

        void fill_polygon3(const Polyloop3 &poly, Color color, float alpha = 1.f, bool doubleSided = false);
        void stroke_light_polygon3(const Polyloop3 &poly, Color color, float alpha = 1.f);

        // faces painted with elem2color, outlines in edgeColor
        void draw_segmented_mesh(const std::vector<Polyloop3> &faces, const std::vector<Color> &elem2color, Color edgeColor);

        void runMainLoop(const FrameCallbacks &callBack);
    };

    //-----------------------------------辅助方法------------------------------------

    inline Vector3 vec3_to_Vector3(const Vec3 &v3)
    {
        return {v3.x(), v3.z(), -v3.y()};
    }

    std::vector<Vector3> vec3_to_Vector3_arr(const std::vector<Vec3> &arr);
}
