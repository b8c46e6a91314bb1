#ifndef _POSSYNC_MSG_SYNCMSG_JSON_
#define _POSSYNC_MSG_SYNCMSG_JSON_

#include "../pchheader.hpp"
#include "../remote/api_client.hpp"

namespace msg::syncmsg::json
{
    void create_upload_request(std::string &msg, const remote::upload_batch &batch);

    int parse_upload_response(remote::api_result &result, const int status_code, std::string_view body);

    int parse_download_response(remote::download_result &result, const int status_code, std::string_view body);

    int extract_product(db::product_record &product, const jsoncons::ojson &d);

    int extract_stock(db::stock_record &stock, const jsoncons::ojson &d);

    void populate_product_json(jsoncons::ojson &d, const db::product_record &product);

    void populate_stock_json(jsoncons::ojson &d, const db::stock_record &stock);

} // namespace msg::syncmsg::json

#endif
