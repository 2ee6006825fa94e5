#include "render.h"

#include <cmath>

using std::vector;

namespace render
{
    Renderer3D::Renderer3D(int width, int height, float fovy, CameraProjection proj, const char *name)
        : name_(name), width_(width), height_(height), fovy_(fovy), projection_(proj),
          yaw_(0.8f), pitch_(0.4f), distance_(14.f)
    {
        camera_.position = {50.f, 50.f, 50.f};
        camera_.target = {0.f, 0.f, 0.f};
        camera_.up = {0.f, 1.f, 0.f};
        camera_.fovy = fovy_;
        camera_.projection = projection_;

        InitWindow(width_, height_, name_);
        SetTargetFPS(120);
    }

    Renderer3D::~Renderer3D()
    {
        CloseWindow();
    }

    void Renderer3D::lookAt(const Vec3 &target, float distance)
    {
        camera_.target = vec3_to_Vector3(target);
        distance_ = fmaxf(0.05f, distance);
    }

    void Renderer3D::updateCamera()
    {
        Vector2 md = GetMouseDelta();

        // 左键旋转
        if (IsMouseButtonDown(MOUSE_BUTTON_LEFT))
        {
            yaw_ -= md.x * RENDER_ROTATE_SPEED;
            pitch_ = Clamp(pitch_ + md.y * RENDER_ROTATE_SPEED, -PI / 2 + 0.01f, PI / 2 - 0.01f);
        }

        // zoom is relative so small and large meshes feel the same
        float wheel = GetMouseWheelMove();
        if (wheel != 0)
            distance_ = fmaxf(0.05f, distance_ * powf(0.9f, wheel * RENDER_ZOOM_SPEED));

        Vector3 offset = {
            distance_ * cosf(pitch_) * sinf(yaw_),
            distance_ * sinf(pitch_),
            distance_ * cosf(pitch_) * cosf(yaw_)};

        // 右键或者滚轮按下：平移, in the view plane, proportional to the orbit distance
        if (IsMouseButtonDown(MOUSE_BUTTON_RIGHT) || IsMouseButtonDown(MOUSE_BUTTON_MIDDLE))
        {
            Vector3 forward = Vector3Normalize(Vector3Negate(offset));
            Vector3 right = Vector3Normalize(Vector3CrossProduct(forward, {0, 1, 0}));
            Vector3 up = Vector3CrossProduct(right, forward);

            float scale = distance_ * RENDER_MOVE_SPEED * 0.1f;
            Vector3 pan = Vector3Add(
                Vector3Scale(right, -md.x * scale),
                Vector3Scale(up, md.y * scale));
            camera_.target = Vector3Add(camera_.target, pan);
        }

        camera_.position = Vector3Add(camera_.target, offset);
        camera_.up = {0, 1, 0};
    }

    void Renderer3D::fill_polygon3(const Polyloop3 &poly, Color color, float alpha, bool doubleSided)
    {
        if (poly.triangles().empty())
            return;
        for (auto &tri : poly.triangles())
        {
            Vector3 a = vec3_to_Vector3(poly.points()[tri.at(0)]);
            Vector3 b = vec3_to_Vector3(poly.points()[tri.at(1)]);
            Vector3 c = vec3_to_Vector3(poly.points()[tri.at(2)]);
            DrawTriangle3D(a, b, c, Fade(color, alpha));
            if (doubleSided)
                DrawTriangle3D(a, c, b, Fade(color, alpha));
        }
    }

    void Renderer3D::stroke_light_polygon3(const Polyloop3 &poly, Color color, float alpha)
    {
        vector<Vector3> pts_vector3 = vec3_to_Vector3_arr(poly.points());
        size_t n = pts_vector3.size();
        for (size_t i = 0; i < n; ++i)
        {
            DrawLine3D(pts_vector3[i], pts_vector3[(i + 1) % n], Fade(color, alpha));
        }
    }

    void Renderer3D::draw_segmented_mesh(const std::vector<Polyloop3> &faces, const std::vector<Color> &elem2color, Color edgeColor)
    {
        for (size_t i_elem = 0; i_elem < faces.size(); ++i_elem)
        {
            Color color = i_elem < elem2color.size() ? elem2color[i_elem] : LIGHTGRAY;
            fill_polygon3(faces[i_elem], color, 1.f, true);
            stroke_light_polygon3(faces[i_elem], edgeColor, 0.6f);
        }
    }

    void Renderer3D::runMainLoop(const FrameCallbacks &callBack)
    {
        while (!WindowShouldClose())
        {
            updateCamera();
            if (callBack.onUpdate)
                callBack.onUpdate();
            BeginDrawing();
            ClearBackground(RAYWHITE);
            BeginMode3D(camera_);
            if (callBack.onDraw3D)
                callBack.onDraw3D();
            EndMode3D();
            if (callBack.onDraw2D)
                callBack.onDraw2D();
            EndDrawing();
        }
    }

    vector<Vector3> vec3_to_Vector3_arr(const vector<Vec3> &arr)
    {
        vector<Vector3> arr3;
        arr3.reserve(arr.size());
        for (const auto &p : arr)
            arr3.push_back(vec3_to_Vector3(p));
        return arr3;
    }
}
