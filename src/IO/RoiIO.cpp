#include <PathoRoi/IO/RoiIO.h>
#include <PathoRoi/Core/Exception.h>
#include <PathoRoi/Platform/FileIO.h>

#include <string>

namespace Patho::Roi::IO {

using Platform::BinaryReader;
using Platform::BinaryWriter;

namespace {

// Sanity limits for reading
constexpr uint64_t MAX_POINTS = 100 * 1024 * 1024;
constexpr uint64_t MAX_RINGS = 10 * 1024 * 1024;

void WriteRect(BinaryWriter& writer, const Rect2d& r) {
    writer.Write<double>(r.x);
    writer.Write<double>(r.y);
    writer.Write<double>(r.width);
    writer.Write<double>(r.height);
}

void WritePoints(BinaryWriter& writer, const std::vector<Point2d>& points) {
    writer.Write<uint64_t>(points.size());
    for (const auto& p : points) {
        writer.Write<double>(p.x);
        writer.Write<double>(p.y);
    }
}

Rect2d ReadRect(BinaryReader& reader) {
    Rect2d r;
    r.x = reader.Read<double>();
    r.y = reader.Read<double>();
    r.width = reader.Read<double>();
    r.height = reader.Read<double>();
    return r;
}

std::vector<Point2d> ReadPoints(BinaryReader& reader) {
    uint64_t count = reader.Read<uint64_t>();
    if (count > MAX_POINTS || count > reader.Remaining() / (2 * sizeof(double))) {
        throw IOException("DeserializeRoi: invalid point count: " + std::to_string(count));
    }
    std::vector<Point2d> points;
    points.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        double x = reader.Read<double>();
        double y = reader.Read<double>();
        points.emplace_back(x, y);
    }
    return points;
}

} // anonymous namespace

std::vector<uint8_t> SerializeRoi(const QRoi& roi) {
    BinaryWriter writer;
    writer.Write<uint32_t>(ROI_FORMAT_MAGIC);
    writer.Write<uint32_t>(ROI_FORMAT_VERSION);
    writer.Write<uint8_t>(static_cast<uint8_t>(roi.Kind()));
    writer.Write<int32_t>(roi.Plane().z);
    writer.Write<int32_t>(roi.Plane().t);
    writer.Write<int32_t>(roi.Plane().c);

    const RoiShape& shape = roi.Shape();
    switch (roi.Kind()) {
        case RoiKind::Rectangle:
            WriteRect(writer, std::get<RectangleShape>(shape).bounds);
            break;
        case RoiKind::Ellipse:
            WriteRect(writer, std::get<EllipseShape>(shape).bounds);
            break;
        case RoiKind::Polygon:
            WritePoints(writer, std::get<PolygonShape>(shape).vertices);
            break;
        case RoiKind::Composite: {
            const auto& rings = std::get<CompositeShape>(shape).rings;
            writer.Write<uint64_t>(rings.size());
            for (const auto& ring : rings) {
                WritePoints(writer, ring);
            }
            break;
        }
        case RoiKind::Line: {
            const auto& line = std::get<LineShape>(shape);
            writer.Write<double>(line.start.x);
            writer.Write<double>(line.start.y);
            writer.Write<double>(line.end.x);
            writer.Write<double>(line.end.y);
            break;
        }
        case RoiKind::Polyline:
            WritePoints(writer, std::get<PolylineShape>(shape).vertices);
            break;
        case RoiKind::Points:
            WritePoints(writer, std::get<PointsShape>(shape).points);
            break;
    }
    return writer.Release();
}

QRoi DeserializeRoi(const std::vector<uint8_t>& data) {
    BinaryReader reader(data);

    uint32_t magic = reader.Read<uint32_t>();
    if (magic != ROI_FORMAT_MAGIC) {
        throw IOException("DeserializeRoi: invalid format (magic mismatch)");
    }
    uint32_t version = reader.Read<uint32_t>();
    if (version != ROI_FORMAT_VERSION) {
        throw VersionMismatchException("DeserializeRoi: unsupported version: " + std::to_string(version));
    }

    uint8_t kind = reader.Read<uint8_t>();
    ImagePlane plane;
    plane.z = reader.Read<int32_t>();
    plane.t = reader.Read<int32_t>();
    plane.c = reader.Read<int32_t>();

    QRoi roi;
    switch (static_cast<RoiKind>(kind)) {
        case RoiKind::Rectangle: {
            Rect2d r = ReadRect(reader);
            roi = QRoi::Rectangle(r.x, r.y, r.width, r.height, plane);
            break;
        }
        case RoiKind::Ellipse: {
            Rect2d r = ReadRect(reader);
            roi = QRoi::Ellipse(r.x, r.y, r.width, r.height, plane);
            break;
        }
        case RoiKind::Polygon:
            roi = QRoi::Polygon(ReadPoints(reader), plane);
            break;
        case RoiKind::Composite: {
            uint64_t count = reader.Read<uint64_t>();
            if (count > MAX_RINGS || count > reader.Remaining() / sizeof(uint64_t)) {
                throw IOException("DeserializeRoi: invalid ring count: " + std::to_string(count));
            }
            std::vector<Ring2d> rings;
            rings.reserve(static_cast<size_t>(count));
            for (uint64_t i = 0; i < count; ++i) {
                rings.push_back(ReadPoints(reader));
            }
            roi = QRoi::Composite(rings, plane);
            break;
        }
        case RoiKind::Line: {
            double x1 = reader.Read<double>();
            double y1 = reader.Read<double>();
            double x2 = reader.Read<double>();
            double y2 = reader.Read<double>();
            roi = QRoi::Line(x1, y1, x2, y2, plane);
            break;
        }
        case RoiKind::Polyline:
            roi = QRoi::Polyline(ReadPoints(reader), plane);
            break;
        case RoiKind::Points:
            roi = QRoi::Points(ReadPoints(reader), plane);
            break;
        default:
            throw IOException("DeserializeRoi: unknown ROI kind: " + std::to_string(kind));
    }

    if (!reader.IsEof()) {
        throw IOException("DeserializeRoi: " + std::to_string(reader.Remaining()) +
                          " trailing bytes");
    }
    return roi;
}

void WriteRoi(const QRoi& roi, const std::string& filename) {
    if (!Platform::WriteBinaryFile(filename, SerializeRoi(roi))) {
        throw IOException("WriteRoi: failed to write file: " + filename);
    }
}

QRoi ReadRoi(const std::string& filename) {
    std::vector<uint8_t> data;
    if (!Platform::ReadBinaryFile(filename, data)) {
        throw IOException("ReadRoi: failed to open file: " + filename);
    }
    return DeserializeRoi(data);
}

} // namespace Patho::Roi::IO
