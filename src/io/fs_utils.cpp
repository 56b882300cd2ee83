#include "io/fs_utils.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace lazyserve::io
{
    namespace
    {

        fs::path stripTrailingSeparator(fs::path path)
        {
            if (!path.has_filename() && path.has_relative_path())
            {
                return path.parent_path();
            }
            return path;
        }

        void noteFileTime(
            const fs::path &file,
            Fingerprint &latest,
            const lazyserve::Context &ctx)
        {
            std::error_code ec;
            const Fingerprint stamp = fs::last_write_time(file, ec);
            if (ec)
            {
                // Typically removed between listing and stat.
                ctx.debug("Skipping ", file.string(), ": ", ec.message());
                return;
            }
            if (stamp > latest)
            {
                latest = stamp;
            }
        }

    } // namespace

    fs::path normalizeIgnoredPath(const fs::path &path, const fs::path &base)
    {
        const fs::path absolute = path.is_absolute() ? path : base / path;

        std::error_code ec;
        fs::path canonical = fs::weakly_canonical(absolute, ec);
        if (ec)
        {
            return stripTrailingSeparator(absolute.lexically_normal());
        }
        return stripTrailingSeparator(canonical.lexically_normal());
    }

    Fingerprint computeFingerprint(
        const fs::path &root,
        const std::set<fs::path> &ignoredPaths,
        const lazyserve::Context &ctx)
    {
        std::error_code ec;
        const fs::path cwd = fs::current_path(ec);
        const fs::path start = normalizeIgnoredPath(root, ec ? fs::path() : cwd);

        Fingerprint latest = kNeverModified;
        if (ignoredPaths.count(start) != 0)
        {
            return latest;
        }

        std::vector<fs::path> pending;
        pending.push_back(start);

        while (!pending.empty())
        {
            const fs::path dir = std::move(pending.back());
            pending.pop_back();

            fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
            if (ec)
            {
                ctx.debug("Skipping directory ", dir.string(), ": ", ec.message());
                ec.clear();
                continue;
            }

            const fs::directory_iterator end;
            while (it != end)
            {
                const fs::path path = it->path();

                if (ignoredPaths.count(path) == 0)
                {
                    const fs::file_status linkStatus = it->symlink_status(ec);
                    if (ec)
                    {
                        ctx.debug("Skipping ", path.string(), ": ", ec.message());
                        ec.clear();
                    }
                    else if (fs::is_symlink(linkStatus))
                    {
                        // Links to files count, links to directories are not followed.
                        if (fs::is_regular_file(fs::status(path, ec)))
                        {
                            noteFileTime(path, latest, ctx);
                        }
                        ec.clear();
                    }
                    else if (fs::is_directory(linkStatus))
                    {
                        pending.push_back(path);
                    }
                    else if (fs::is_regular_file(linkStatus))
                    {
                        noteFileTime(path, latest, ctx);
                    }
                }

                it.increment(ec);
                if (ec)
                {
                    ctx.debug("Stopped listing ", dir.string(), ": ", ec.message());
                    ec.clear();
                    break;
                }
            }
        }

        return latest;
    }

    bool isPathInside(const fs::path &path, const fs::path &root)
    {
        const fs::path normalPath = stripTrailingSeparator(path.lexically_normal());
        const fs::path normalRoot = stripTrailingSeparator(root.lexically_normal());

        auto pathIt = normalPath.begin();
        auto rootIt = normalRoot.begin();
        while (rootIt != normalRoot.end())
        {
            if (pathIt == normalPath.end() || *pathIt != *rootIt)
            {
                return false;
            }
            ++pathIt;
            ++rootIt;
        }
        return true;
    }

} // namespace lazyserve::io
