#include "UploadSession.hpp"
#include "../common/Utils.hpp"

using namespace std;

string UploadSession::safe_filename(const string &name) {
    return utils::safe_component(utils::base_name(name));
}

UploadSession UploadSession::from_header(const string &root_dir,
                                         const string &client_name,
                                         const string &filename,
                                         const string &upload_id,
                                         uint64_t file_size) {
    UploadSession s;
    // client_name và upload_id cũng là một thành phần path nên phải làm sạch,
    // nếu không "../x" sẽ thoát khỏi root_dir.
    s.client_name = utils::safe_component(client_name);
    s.filename    = safe_filename(filename);
    s.upload_id   = utils::safe_component(upload_id);
    s.file_size   = file_size;
    s.client_dir  = utils::join_path(root_dir, s.client_name);
    s.part_path   = utils::join_path(s.client_dir, s.upload_id + "_" + s.filename + ".part");
    s.done_path   = utils::join_path(s.client_dir, s.upload_id + ".done");
    return s;
}
